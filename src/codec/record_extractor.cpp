#include "ngx_cache_inspect/record_extractor.hpp"

#include <cstddef>
#include <cstring>

namespace ngx_cache_inspect {
namespace {

bool ascii_slice(const std::vector<std::uint8_t> &bytes, std::size_t begin,
                 std::size_t end, const char *region, std::string *out,
                 Error *err) {
  for (std::size_t i = begin; i < end; ++i) {
    if (bytes[i] >= 0x80)
      return fail(err, ErrorKind::NonAsciiText,
                  std::string(region) + ": non-ASCII byte at offset " +
                      std::to_string(i));
  }
  out->assign(reinterpret_cast<const char *>(bytes.data()) + begin, end - begin);
  return true;
}

bool unwrap_key(const std::string &region, std::string *key, Error *err) {
  const std::size_t pre = std::strlen(kKeyPrefix);
  const std::size_t suf = std::strlen(kKeySuffix);
  if (region.size() < pre + suf || region.compare(0, pre, kKeyPrefix) != 0 ||
      region.compare(region.size() - suf, suf, kKeySuffix) != 0)
    return fail(err, ErrorKind::BadKeyDelimiter,
                "key region of " + std::to_string(region.size()) +
                    " bytes is not wrapped in \"\\nKEY: \" ... \"\\n\"");
  *key = region.substr(pre, region.size() - pre - suf);
  return true;
}

} // namespace

std::optional<CacheRecord>
extract_record(const CacheHeader &header,
               const std::vector<std::uint8_t> &file_bytes, Error *err) {
  const std::size_t hs = header.header_start;
  const std::size_t bs = header.body_start;
  if (hs < kHeaderSize || hs > bs) {
    fail(err, ErrorKind::InvalidOffsets,
         "header_start=" + std::to_string(hs) +
             " body_start=" + std::to_string(bs));
    return std::nullopt;
  }
  if (bs > file_bytes.size()) {
    fail(err, ErrorKind::TruncatedFile,
         "body_start=" + std::to_string(bs) + " beyond file length " +
             std::to_string(file_bytes.size()));
    return std::nullopt;
  }

  CacheRecord rec;
  std::string key_region;
  if (!ascii_slice(file_bytes, kHeaderSize, hs, "key", &key_region, err) ||
      !unwrap_key(key_region, &rec.key, err) ||
      !ascii_slice(file_bytes, hs, bs, "http headers", &rec.http_headers, err))
    return std::nullopt;
  rec.body.assign(file_bytes.begin() + static_cast<std::ptrdiff_t>(bs),
                  file_bytes.end());
  return rec;
}

} // namespace ngx_cache_inspect
