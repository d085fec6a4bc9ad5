#include "ngx_cache_inspect/diagnostics.hpp"

#include <iostream>

namespace ngx_cache_inspect {

Diagnostics stderr_diagnostics() {
  return Diagnostics{
      [](const std::string &msg) { std::cerr << "warning: " << msg << "\n"; }};
}

} // namespace ngx_cache_inspect
