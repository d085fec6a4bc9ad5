#include "ngx_cache_inspect/header_codec.hpp"

#include <cstddef>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <utility>

namespace ngx_cache_inspect {
namespace {
#pragma pack(push, 1)
struct RawHeader {
  std::uint64_t version;
  std::uint64_t valid_sec;
  std::uint64_t updating_sec;
  std::uint64_t error_sec;
  std::uint64_t last_modified;
  std::uint64_t date;
  std::uint32_t crc32;
  std::uint16_t valid_msec;
  std::uint16_t header_start;
  std::uint16_t body_start;
  std::uint8_t etag_len;
  std::uint8_t etag[kEtagLen];
  std::uint8_t vary_len;
  std::uint8_t vary[kVaryLen];
  std::uint8_t variant[kVariantLen];
  std::uint8_t padding[kPaddingLen];
};
#pragma pack(pop)

static_assert(sizeof(RawHeader) == kHeaderSize, "cache header layout/size mismatch");
static_assert(offsetof(RawHeader, valid_sec) == 8, "valid_sec offset mismatch");
static_assert(offsetof(RawHeader, etag) == 59, "etag offset mismatch");
static_assert(offsetof(RawHeader, padding) == 332, "padding offset mismatch");

// Byte order conversion between host and the little-endian file layout; the
// same call converts in both directions.
std::uint16_t le(std::uint16_t v) {
#if __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
  return __builtin_bswap16(v);
#else
  return v;
#endif
}

std::uint32_t le(std::uint32_t v) {
#if __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
  return __builtin_bswap32(v);
#else
  return v;
#endif
}

std::uint64_t le(std::uint64_t v) {
#if __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
  return __builtin_bswap64(v);
#else
  return v;
#endif
}

std::optional<std::uint64_t> instant_or_none(std::uint64_t raw) {
  if (raw == kNoTime)
    return std::nullopt;
  return raw;
}

bool all_zero(const std::uint8_t *p, std::size_t n) {
  for (std::size_t i = 0; i < n; ++i)
    if (p[i] != 0)
      return false;
  return true;
}

std::string hex_bytes(const std::uint8_t *p, std::size_t n) {
  std::ostringstream os;
  os << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < n; ++i) {
    if (i)
      os << ' ';
    os << std::setw(2) << static_cast<unsigned>(p[i]);
  }
  return os.str();
}

bool text_or_none(const std::uint8_t *buf, std::size_t n, const char *field,
                  std::optional<std::string> *out, Error *err) {
  if (all_zero(buf, n)) {
    out->reset();
    return true;
  }
  std::size_t end = n;
  while (end > 0 && buf[end - 1] == 0)
    --end;
  for (std::size_t i = 0; i < end; ++i) {
    if (buf[i] < 0x20 || buf[i] > 0x7e) {
      return fail(err, ErrorKind::NonAsciiText,
                  std::string(field) + ": byte 0x" + hex_bytes(&buf[i], 1) +
                      " at position " + std::to_string(i) +
                      " is not printable ASCII");
    }
  }
  *out = std::string(reinterpret_cast<const char *>(buf), end);
  return true;
}

bool put_text(const std::optional<std::string> &text, std::uint8_t *buf,
              std::size_t n, const char *field, Error *err) {
  if (!text.has_value())
    return true;
  if (text->size() > n) {
    return fail(err, ErrorKind::FieldOverflow,
                std::string(field) + ": " + std::to_string(text->size()) +
                    " bytes do not fit in " + std::to_string(n));
  }
  std::memcpy(buf, text->data(), text->size());
  return true;
}

} // namespace

std::optional<CacheHeader> decode_header(const std::uint8_t *bytes,
                                         std::size_t len, Error *err,
                                         const Diagnostics *diag) {
  if (bytes == nullptr || len < kHeaderSize) {
    fail(err, ErrorKind::TruncatedFile,
         "cache header needs " + std::to_string(kHeaderSize) +
             " bytes, got " + std::to_string(bytes ? len : 0));
    return std::nullopt;
  }
  RawHeader raw{};
  std::memcpy(&raw, bytes, sizeof(raw));

  CacheHeader h;
  h.version = le(raw.version);
  if (h.version != kSupportedVersion) {
    fail(err, ErrorKind::UnsupportedVersion,
         "unexpected version: " + std::to_string(h.version));
    return std::nullopt;
  }
  h.valid_sec = instant_or_none(le(raw.valid_sec));
  h.updating_sec = instant_or_none(le(raw.updating_sec));
  h.error_sec = instant_or_none(le(raw.error_sec));
  h.last_modified = instant_or_none(le(raw.last_modified));
  h.date = instant_or_none(le(raw.date));
  h.crc32 = le(raw.crc32);
  h.valid_msec = le(raw.valid_msec);
  h.header_start = le(raw.header_start);
  h.body_start = le(raw.body_start);
  h.etag_len = raw.etag_len;
  h.vary_len = raw.vary_len;

  if (!text_or_none(raw.etag, kEtagLen, "etag", &h.etag, err) ||
      !text_or_none(raw.vary, kVaryLen, "vary", &h.vary, err) ||
      !text_or_none(raw.variant, kVariantLen, "variant", &h.variant, err))
    return std::nullopt;

  std::memcpy(h.padding.data(), raw.padding, kPaddingLen);
  if (diag && !all_zero(raw.padding, kPaddingLen))
    diag->warning("unexpected non-zero bytes: " +
                  hex_bytes(raw.padding, kPaddingLen));

  if (h.header_start < kHeaderSize || h.header_start > h.body_start) {
    fail(err, ErrorKind::InvalidOffsets,
         "header_start=" + std::to_string(h.header_start) +
             " body_start=" + std::to_string(h.body_start) +
             " (need " + std::to_string(kHeaderSize) +
             " <= header_start <= body_start)");
    return std::nullopt;
  }
  return h;
}

std::optional<CacheHeader> decode_header(const std::vector<std::uint8_t> &bytes,
                                         Error *err, const Diagnostics *diag) {
  return decode_header(bytes.data(), bytes.size(), err, diag);
}

std::optional<std::vector<std::uint8_t>> encode_header(const CacheHeader &h,
                                                       Error *err) {
  RawHeader raw{};
  raw.version = le(h.version);
  raw.valid_sec = le(h.valid_sec.value_or(kNoTime));
  raw.updating_sec = le(h.updating_sec.value_or(kNoTime));
  raw.error_sec = le(h.error_sec.value_or(kNoTime));
  raw.last_modified = le(h.last_modified.value_or(kNoTime));
  raw.date = le(h.date.value_or(kNoTime));
  raw.crc32 = le(h.crc32);
  raw.valid_msec = le(h.valid_msec);
  raw.header_start = le(h.header_start);
  raw.body_start = le(h.body_start);
  raw.etag_len = h.etag_len;
  raw.vary_len = h.vary_len;
  if (!put_text(h.etag, raw.etag, kEtagLen, "etag", err) ||
      !put_text(h.vary, raw.vary, kVaryLen, "vary", err) ||
      !put_text(h.variant, raw.variant, kVariantLen, "variant", err))
    return std::nullopt;
  std::memcpy(raw.padding, h.padding.data(), kPaddingLen);

  std::vector<std::uint8_t> out(sizeof(raw));
  std::memcpy(out.data(), &raw, sizeof(raw));
  return out;
}

FieldLocation expiry_field() {
  return {offsetof(RawHeader, valid_sec), sizeof(RawHeader::valid_sec)};
}

std::optional<std::uint64_t> to_epoch_seconds(TimePoint t) {
  const auto secs =
      std::chrono::floor<std::chrono::seconds>(t.time_since_epoch()).count();
  if (secs < 0)
    return std::nullopt;
  return static_cast<std::uint64_t>(secs);
}

bool patch_expiry(FileHandle file, TimePoint expires, Error *err) {
  if (!file.valid())
    return fail(err, ErrorKind::IoError, "cache file is not open");
  const auto secs = to_epoch_seconds(expires);
  if (!secs.has_value())
    return fail(err, ErrorKind::InvalidTimestamp,
                "expiry before 1970-01-01 cannot be stored in valid_sec");

  const FieldLocation loc = expiry_field();
  if (!file.lock_exclusive(err))
    return false;
  const auto size = file.size(err);
  if (!size.has_value())
    return false;
  if (*size < loc.offset + loc.width)
    return fail(err, ErrorKind::TruncatedFile,
                "file is " + std::to_string(*size) +
                    " bytes, too short to hold valid_sec");

  const std::uint64_t v = le(*secs);
  std::uint8_t buf[sizeof(v)];
  std::memcpy(buf, &v, sizeof(v));
  if (!file.write_at(buf, loc.width, loc.offset, err))
    return false;
  return file.close(err);
}

bool patch_expiry(const std::string &path, TimePoint expires, Error *err) {
  FileHandle file = FileHandle::open_read_write(path, err);
  if (!file.valid())
    return false;
  return patch_expiry(std::move(file), expires, err);
}

} // namespace ngx_cache_inspect
