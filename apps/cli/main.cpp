#include "ngx_cache_inspect/cache_file.hpp"
#include "ngx_cache_inspect/header_codec.hpp"
#include "ngx_cache_inspect/options.hpp"
#include "ngx_cache_inspect/report.hpp"

#include <iostream>
#include <string>

using namespace ngx_cache_inspect;

namespace {

void report_error(const std::string &path, const Error &err) {
  std::cerr << path << ": " << error_kind_name(err.kind) << ": " << err.message
            << "\n";
}

bool process_file(const std::string &path, const Options &opts,
                  const Diagnostics &diag) {
  Error err;
  auto info = inspect_cache_file(path, &err, &diag);
  if (!info.has_value()) {
    report_error(path, err);
    return false;
  }
  if (opts.set_expire.has_value()) {
    if (!patch_expiry(path, *opts.set_expire, &err)) {
      report_error(path, err);
      return false;
    }
    info = inspect_cache_file(path, &err, &diag);
    if (!info.has_value()) {
      report_error(path, err);
      return false;
    }
  }
  if (!opts.quiet)
    std::cout << render_report(path, info->header, info->record);
  return true;
}

} // namespace

int main(int argc, char **argv) {
  const std::string prog = argc > 0 ? argv[0] : "ngx_cache_inspect";
  Options opts;
  std::string perr;
  if (!parse_options(argc, argv, &opts, &perr)) {
    std::cerr << usage(prog) << prog << ": error: " << perr << "\n";
    return 2;
  }
  if (opts.help) {
    std::cout << usage(prog);
    return 0;
  }

  const Diagnostics diag = stderr_diagnostics();
  int failed = 0;
  for (std::size_t i = 0; i < opts.files.size(); ++i) {
    if (i > 0 && !opts.quiet)
      std::cout << "\n";
    if (!process_file(opts.files[i], opts, diag))
      ++failed;
  }
  return failed == 0 ? 0 : 1;
}
