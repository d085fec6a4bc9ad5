#include "ngx_cache_inspect/cache_file.hpp"

#include "ngx_cache_inspect/header_codec.hpp"
#include "ngx_cache_inspect/record_extractor.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ngx_cache_inspect {
namespace {

bool io_fail(Error *err, const std::string &what) {
  const int e = errno;
  return fail(err, ErrorKind::IoError, what + ": " + std::strerror(e));
}

FileHandle open_with(const std::string &path, int flags, Error *err) {
  int fd;
  do {
    fd = ::open(path.c_str(), flags | O_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0)
    io_fail(err, "open " + path);
  return FileHandle(fd);
}

} // namespace

FileHandle::~FileHandle() {
  if (fd_ >= 0)
    ::close(fd_);
}

FileHandle::FileHandle(FileHandle &&other) noexcept : fd_(other.fd_) {
  other.fd_ = -1;
}

FileHandle &FileHandle::operator=(FileHandle &&other) noexcept {
  if (this != &other) {
    if (fd_ >= 0)
      ::close(fd_);
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

FileHandle FileHandle::open_read(const std::string &path, Error *err) {
  return open_with(path, O_RDONLY, err);
}

FileHandle FileHandle::open_read_write(const std::string &path, Error *err) {
  return open_with(path, O_RDWR, err);
}

std::optional<std::uint64_t> FileHandle::size(Error *err) const {
  struct stat st {};
  if (::fstat(fd_, &st) != 0) {
    io_fail(err, "fstat");
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(st.st_size);
}

bool FileHandle::lock_exclusive(Error *err) {
  while (::flock(fd_, LOCK_EX) != 0) {
    if (errno != EINTR)
      return io_fail(err, "flock");
  }
  return true;
}

bool FileHandle::read_at(void *buf, std::size_t len, std::uint64_t offset,
                         Error *err) const {
  auto *p = static_cast<std::uint8_t *>(buf);
  std::size_t done = 0;
  while (done < len) {
    ssize_t r = ::pread(fd_, p + done, len - done,
                        static_cast<off_t>(offset + done));
    if (r < 0) {
      if (errno == EINTR)
        continue;
      return io_fail(err, "pread");
    }
    if (r == 0)
      return fail(err, ErrorKind::TruncatedFile,
                  "unexpected end of file at offset " +
                      std::to_string(offset + done));
    done += static_cast<std::size_t>(r);
  }
  return true;
}

bool FileHandle::write_at(const void *buf, std::size_t len,
                          std::uint64_t offset, Error *err) {
  const auto *p = static_cast<const std::uint8_t *>(buf);
  std::size_t done = 0;
  while (done < len) {
    ssize_t w = ::pwrite(fd_, p + done, len - done,
                         static_cast<off_t>(offset + done));
    if (w < 0) {
      if (errno == EINTR)
        continue;
      return io_fail(err, "pwrite");
    }
    if (w == 0)
      return fail(err, ErrorKind::IoError,
                  "short write at offset " + std::to_string(offset + done));
    done += static_cast<std::size_t>(w);
  }
  return true;
}

bool FileHandle::close(Error *err) {
  if (fd_ < 0)
    return true;
  const int fd = fd_;
  fd_ = -1;
  if (::close(fd) != 0)
    return io_fail(err, "close");
  return true;
}

std::optional<std::vector<std::uint8_t>> read_cache_file(const std::string &path,
                                                         Error *err) {
  FileHandle f = FileHandle::open_read(path, err);
  if (!f.valid())
    return std::nullopt;
  const auto size = f.size(err);
  if (!size.has_value())
    return std::nullopt;
  std::vector<std::uint8_t> out(static_cast<std::size_t>(*size));
  if (!out.empty() && !f.read_at(out.data(), out.size(), 0, err))
    return std::nullopt;
  return out;
}

std::optional<CacheFileInfo> inspect_cache_file(const std::string &path,
                                                Error *err,
                                                const Diagnostics *diag) {
  auto bytes = read_cache_file(path, err);
  if (!bytes.has_value())
    return std::nullopt;
  auto header = decode_header(*bytes, err, diag);
  if (!header.has_value())
    return std::nullopt;
  auto record = extract_record(*header, *bytes, err);
  if (!record.has_value())
    return std::nullopt;
  return CacheFileInfo{std::move(*header), std::move(*record)};
}

} // namespace ngx_cache_inspect
