#pragma once

#include "ngx_cache_inspect/error.hpp"
#include "ngx_cache_inspect/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ngx_cache_inspect {

constexpr const char *kKeyPrefix = "\nKEY: ";
constexpr const char *kKeySuffix = "\n";

// `file_bytes` is the whole cache file, header included; offsets in the
// header are relative to its start.
std::optional<CacheRecord>
extract_record(const CacheHeader &header,
               const std::vector<std::uint8_t> &file_bytes,
               Error *err = nullptr);

} // namespace ngx_cache_inspect
