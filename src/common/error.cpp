#include "ngx_cache_inspect/error.hpp"

#include <utility>

namespace ngx_cache_inspect {

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::UnsupportedVersion:
    return "UnsupportedVersion";
  case ErrorKind::NonAsciiText:
    return "NonAsciiText";
  case ErrorKind::BadKeyDelimiter:
    return "BadKeyDelimiter";
  case ErrorKind::InvalidOffsets:
    return "InvalidOffsets";
  case ErrorKind::TruncatedFile:
    return "TruncatedFile";
  case ErrorKind::FieldOverflow:
    return "FieldOverflow";
  case ErrorKind::InvalidTimestamp:
    return "InvalidTimestamp";
  case ErrorKind::IoError:
    return "IoError";
  }
  return "Unknown";
}

bool fail(Error *err, ErrorKind kind, std::string message) {
  if (err) {
    err->kind = kind;
    err->message = std::move(message);
  }
  return false;
}

} // namespace ngx_cache_inspect
