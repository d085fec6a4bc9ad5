#pragma once

#include <functional>
#include <string>

namespace ngx_cache_inspect {

using WarningSink = std::function<void(const std::string &)>;

// Receiver for non-fatal anomalies found while decoding.
struct Diagnostics {
  WarningSink warn;

  void warning(const std::string &msg) const {
    if (warn)
      warn(msg);
  }
};

// Writes "warning: <msg>" lines to std::cerr.
Diagnostics stderr_diagnostics();

} // namespace ngx_cache_inspect
