#pragma once

#include "ngx_cache_inspect/cache_file.hpp"
#include "ngx_cache_inspect/diagnostics.hpp"
#include "ngx_cache_inspect/error.hpp"
#include "ngx_cache_inspect/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ngx_cache_inspect {

struct FieldLocation {
  std::size_t offset{0};
  std::size_t width{0};
};

// Decodes the first kHeaderSize bytes of `bytes`. Extra trailing bytes are
// ignored so the whole file can be passed in.
std::optional<CacheHeader> decode_header(const std::uint8_t *bytes,
                                         std::size_t len,
                                         Error *err = nullptr,
                                         const Diagnostics *diag = nullptr);
std::optional<CacheHeader> decode_header(const std::vector<std::uint8_t> &bytes,
                                         Error *err = nullptr,
                                         const Diagnostics *diag = nullptr);

std::optional<std::vector<std::uint8_t>>
encode_header(const CacheHeader &header, Error *err = nullptr);

// Location of valid_sec, the only field patch_expiry writes.
FieldLocation expiry_field();

// Whole seconds since the epoch, rounded down. nullopt before 1970.
std::optional<std::uint64_t> to_epoch_seconds(TimePoint t);

// Writes `expires` into valid_sec. The handle is consumed and closed on
// return. The rest of the header is not validated.
bool patch_expiry(FileHandle file, TimePoint expires, Error *err = nullptr);
bool patch_expiry(const std::string &path, TimePoint expires,
                  Error *err = nullptr);

} // namespace ngx_cache_inspect
