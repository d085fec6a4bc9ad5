#pragma once

#include <string>

namespace ngx_cache_inspect {

enum class ErrorKind {
  None,
  UnsupportedVersion,
  NonAsciiText,
  BadKeyDelimiter,
  InvalidOffsets,
  TruncatedFile,
  FieldOverflow,
  InvalidTimestamp,
  IoError
};

struct Error {
  ErrorKind kind{ErrorKind::None};
  std::string message;
};

const char *error_kind_name(ErrorKind kind);

// Fills *err when err is non-null. Always returns false so callers can
// `return fail(err, ...)`.
bool fail(Error *err, ErrorKind kind, std::string message);

} // namespace ngx_cache_inspect
