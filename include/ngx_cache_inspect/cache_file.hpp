#pragma once

#include "ngx_cache_inspect/diagnostics.hpp"
#include "ngx_cache_inspect/error.hpp"
#include "ngx_cache_inspect/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ngx_cache_inspect {

class FileHandle {
public:
  FileHandle() = default;
  explicit FileHandle(int fd) : fd_(fd) {}
  ~FileHandle();

  FileHandle(const FileHandle &) = delete;
  FileHandle &operator=(const FileHandle &) = delete;
  FileHandle(FileHandle &&other) noexcept;
  FileHandle &operator=(FileHandle &&other) noexcept;

  static FileHandle open_read(const std::string &path, Error *err = nullptr);
  static FileHandle open_read_write(const std::string &path,
                                    Error *err = nullptr);

  bool valid() const { return fd_ >= 0; }
  int fd() const { return fd_; }

  std::optional<std::uint64_t> size(Error *err = nullptr) const;
  bool lock_exclusive(Error *err = nullptr);
  // pread/pwrite until `len` bytes are transferred, retrying on EINTR.
  bool read_at(void *buf, std::size_t len, std::uint64_t offset,
               Error *err = nullptr) const;
  bool write_at(const void *buf, std::size_t len, std::uint64_t offset,
                Error *err = nullptr);
  bool close(Error *err = nullptr);

private:
  int fd_{-1};
};

struct CacheFileInfo {
  CacheHeader header;
  CacheRecord record;
};

std::optional<std::vector<std::uint8_t>>
read_cache_file(const std::string &path, Error *err = nullptr);

// Read + decode + extract for a single file.
std::optional<CacheFileInfo>
inspect_cache_file(const std::string &path, Error *err = nullptr,
                   const Diagnostics *diag = nullptr);

} // namespace ngx_cache_inspect
