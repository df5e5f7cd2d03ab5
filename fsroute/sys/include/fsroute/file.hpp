#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>

#include "fsroute/base-fd.hpp"

namespace fsroute {

// Read-only file opened for the duration of one request.
// The route index never keeps File objects: only paths are stored between requests.
class File {
 public:
  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  // Default-constructed File is closed.
  File() noexcept = default;

  // Open 'path' read-only. Never throws on open failure: operator bool() returns false and the failure is logged.
  explicit File(const char* path);

  explicit File(const std::string& path) : File(path.c_str()) {}

  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Size in bytes at the time of opening, or kError if the file is not opened.
  [[nodiscard]] std::size_t size() const noexcept { return _fileSize; }

  // Read up to dst.size() bytes at the absolute 'offset' (pread, the file offset is not modified).
  // Returns the number of bytes read (0 on EOF), kError on error.
  [[nodiscard]] std::size_t readAt(std::span<std::byte> dst, std::uint64_t offset) const;

  // Read the whole file content. Throws std::runtime_error on read error or if the file is not opened.
  [[nodiscard]] std::string loadAllContent() const;

 private:
  BaseFd _fd;
  std::size_t _fileSize{kError};
};

}  // namespace fsroute
