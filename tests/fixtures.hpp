#pragma once

#include "ngx_cache_inspect/header_codec.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace fixtures {

using namespace ngx_cache_inspect;

inline CacheHeader basic_header() {
  CacheHeader h;
  h.valid_sec = 1700000000;
  h.crc32 = 0xdeadbeef;
  h.valid_msec = 250;
  h.header_start = static_cast<std::uint16_t>(kHeaderSize);
  h.body_start = static_cast<std::uint16_t>(kHeaderSize);
  return h;
}

// Header bytes followed by the three trailing regions; header_start and
// body_start are set from the region sizes.
inline std::vector<std::uint8_t> build_file(CacheHeader h,
                                            const std::string &key_region,
                                            const std::string &http_headers,
                                            const std::string &body) {
  h.header_start = static_cast<std::uint16_t>(kHeaderSize + key_region.size());
  h.body_start =
      static_cast<std::uint16_t>(h.header_start + http_headers.size());
  auto out = *encode_header(h);
  out.insert(out.end(), key_region.begin(), key_region.end());
  out.insert(out.end(), http_headers.begin(), http_headers.end());
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

inline void put_u64_le(std::vector<std::uint8_t> &buf, std::size_t off,
                       std::uint64_t v) {
  for (std::size_t i = 0; i < 8; ++i)
    buf[off + i] = static_cast<std::uint8_t>(v >> (8 * i));
}

inline std::uint64_t get_u64_le(const std::vector<std::uint8_t> &buf,
                                std::size_t off) {
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < 8; ++i)
    v |= static_cast<std::uint64_t>(buf[off + i]) << (8 * i);
  return v;
}

inline std::string temp_path(const std::string &name) {
  return (std::filesystem::temp_directory_path() /
          ("ngx_cache_inspect_" + name))
      .string();
}

inline std::string write_temp(const std::string &name,
                              const std::vector<std::uint8_t> &bytes) {
  const auto path = temp_path(name);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char *>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  return path;
}

inline std::vector<std::uint8_t> slurp(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in),
                                   std::istreambuf_iterator<char>());
}

} // namespace fixtures
