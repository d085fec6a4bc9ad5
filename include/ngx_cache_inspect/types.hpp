#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ngx_cache_inspect {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ngx_http_file_cache_header_t as written by nginx on Linux x86_64.
constexpr std::uint64_t kSupportedVersion = 5;
constexpr std::size_t kHeaderSize = 336;
constexpr std::size_t kEtagLen = 128;
constexpr std::size_t kVaryLen = 128;
constexpr std::size_t kVariantLen = 16;
constexpr std::size_t kPaddingLen = 4;
constexpr std::uint64_t kNoTime = UINT64_MAX;

struct CacheHeader {
  std::uint64_t version{kSupportedVersion};
  std::optional<std::uint64_t> valid_sec;
  std::optional<std::uint64_t> updating_sec;
  std::optional<std::uint64_t> error_sec;
  std::optional<std::uint64_t> last_modified;
  std::optional<std::uint64_t> date;
  std::uint32_t crc32{0};
  std::uint16_t valid_msec{0};
  std::uint16_t header_start{0};
  std::uint16_t body_start{0};
  std::uint8_t etag_len{0};
  std::optional<std::string> etag;
  std::uint8_t vary_len{0};
  std::optional<std::string> vary;
  std::optional<std::string> variant;
  std::array<std::uint8_t, kPaddingLen> padding{};
};

struct CacheRecord {
  std::string key;
  std::string http_headers;
  std::vector<std::uint8_t> body;
};

} // namespace ngx_cache_inspect
