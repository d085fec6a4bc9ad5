#pragma once

#include "ngx_cache_inspect/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ngx_cache_inspect {

struct Options {
  bool quiet{false};
  bool help{false};
  std::optional<TimePoint> set_expire;
  std::vector<std::string> files;
};

bool parse_options(int argc, const char *const *argv, Options *out,
                   std::string *err = nullptr);

std::string usage(const std::string &prog);

// Accepts "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M:%S" and "%Y-%m-%d", read as
// local time.
std::optional<TimePoint> parse_date_string(const std::string &s);

} // namespace ngx_cache_inspect
