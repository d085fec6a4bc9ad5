#include "ngx_cache_inspect/options.hpp"

#include <ctime>
#include <utility>

namespace ngx_cache_inspect {
namespace {

bool set_err(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
  return false;
}

bool take_expire(const std::string &value, Options *out, std::string *err) {
  auto t = parse_date_string(value);
  if (!t.has_value())
    return set_err(err, "Unable to parse date: " + value);
  out->set_expire = *t;
  return true;
}

} // namespace

bool parse_options(int argc, const char *const *argv, Options *out,
                   std::string *err) {
  Options opts;
  bool only_files = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (only_files || a.empty() || a[0] != '-' || a == "-") {
      opts.files.push_back(a);
    } else if (a == "--") {
      only_files = true;
    } else if (a == "-q" || a == "--quiet") {
      opts.quiet = true;
    } else if (a == "-h" || a == "--help") {
      opts.help = true;
    } else if (a == "--set-expire") {
      if (i + 1 >= argc)
        return set_err(err, "--set-expire requires a date");
      if (!take_expire(argv[++i], &opts, err))
        return false;
    } else if (a.rfind("--set-expire=", 0) == 0) {
      if (!take_expire(a.substr(13), &opts, err))
        return false;
    } else {
      return set_err(err, "unknown option: " + a);
    }
  }
  if (!opts.help && opts.files.empty())
    return set_err(err, "at least one cache file is required");
  *out = std::move(opts);
  return true;
}

std::string usage(const std::string &prog) {
  return "usage: " + prog +
         " [-h] [--set-expire DATE] [-q] FILE [FILE ...]\n"
         "\n"
         "Examine Nginx cache file\n"
         "\n"
         "  --set-expire DATE  modify expiry date (valid_sec) in cache files;\n"
         "                     DATE is YYYY-MM-DDTHH:MM:SS, YYYY-MM-DD HH:MM:SS\n"
         "                     or YYYY-MM-DD in local time\n"
         "  -q, --quiet        hide output\n"
         "  -h, --help         show this help\n";
}

std::optional<TimePoint> parse_date_string(const std::string &s) {
  static const char *const formats[] = {"%Y-%m-%dT%H:%M:%S",
                                        "%Y-%m-%d %H:%M:%S", "%Y-%m-%d"};
  for (const char *fmt : formats) {
    std::tm tm{};
    const char *end = strptime(s.c_str(), fmt, &tm);
    if (end == nullptr || *end != '\0')
      continue;
    std::tm parsed = tm;
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1))
      continue;
    // mktime normalises out-of-range days such as 02-31.
    if (tm.tm_year != parsed.tm_year || tm.tm_mon != parsed.tm_mon ||
        tm.tm_mday != parsed.tm_mday)
      continue;
    return Clock::from_time_t(t);
  }
  return std::nullopt;
}

} // namespace ngx_cache_inspect
