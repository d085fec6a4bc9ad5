#pragma once

#include "ngx_cache_inspect/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ngx_cache_inspect {

// "YYYY-MM-DD HH:MM:SS" in local time, "None" when absent.
std::string format_instant(const std::optional<std::uint64_t> &epoch_sec);

std::string header_fields(const CacheHeader &h);

std::string render_report(const std::string &path, const CacheHeader &header,
                          const CacheRecord &record);

} // namespace ngx_cache_inspect
