#include "ngx_cache_inspect/report.hpp"

#include <ctime>
#include <limits>
#include <sstream>

namespace ngx_cache_inspect {
namespace {

std::string text_or_none(const std::optional<std::string> &s) {
  return s.has_value() ? *s : "None";
}

std::string strip(const std::string &s) {
  const char *ws = " \t\r\n\v\f";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string::npos)
    return "";
  const auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

} // namespace

std::string format_instant(const std::optional<std::uint64_t> &epoch_sec) {
  if (!epoch_sec.has_value())
    return "None";
  if (*epoch_sec >
      static_cast<std::uint64_t>(std::numeric_limits<std::time_t>::max()))
    return std::to_string(*epoch_sec);
  const auto t = static_cast<std::time_t>(*epoch_sec);
  std::tm tm{};
  if (localtime_r(&t, &tm) == nullptr)
    return std::to_string(*epoch_sec);
  char buf[64];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0)
    return std::to_string(*epoch_sec);
  return buf;
}

std::string header_fields(const CacheHeader &h) {
  std::ostringstream os;
  os << "version: " << h.version << "\n";
  os << "valid_sec: " << format_instant(h.valid_sec) << "\n";
  os << "updating_sec: " << format_instant(h.updating_sec) << "\n";
  os << "error_sec: " << format_instant(h.error_sec) << "\n";
  os << "last_modified: " << format_instant(h.last_modified) << "\n";
  os << "date: " << format_instant(h.date) << "\n";
  os << "crc32: " << h.crc32 << "\n";
  os << "valid_msec: " << h.valid_msec << "\n";
  os << "header_start: " << h.header_start << "\n";
  os << "body_start: " << h.body_start << "\n";
  os << "etag_len: " << static_cast<unsigned>(h.etag_len) << "\n";
  os << "etag: " << text_or_none(h.etag) << "\n";
  os << "vary_len: " << static_cast<unsigned>(h.vary_len) << "\n";
  os << "vary: " << text_or_none(h.vary) << "\n";
  os << "variant: " << text_or_none(h.variant) << "\n";
  return os.str();
}

std::string render_report(const std::string &path, const CacheHeader &header,
                          const CacheRecord &record) {
  std::ostringstream os;
  os << "** Nginx cache header ** " << path << "\n";
  os << header_fields(header);
  os << "\n** Nginx cache key **\n" << record.key << "\n";
  os << "\n** HTTP headers **\n" << strip(record.http_headers) << "\n";
  os << "\n** HTTP body length **\n" << record.body.size() << "\n";
  return os.str();
}

} // namespace ngx_cache_inspect
