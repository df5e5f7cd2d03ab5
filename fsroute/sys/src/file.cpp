#include "fsroute/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>

#include "fsroute/log.hpp"

namespace fsroute {

File::File(const char* path) : _fd(::open(path, O_RDONLY | O_CLOEXEC)) {
  if (!_fd) {
    log::error("Unable to open file '{}' (errno {}: {})", path, errno, std::strerror(errno));
    return;
  }
  struct stat st{};
  if (::fstat(_fd.fd(), &st) != 0) {
    log::error("Unable to stat file '{}' (errno {}: {})", path, errno, std::strerror(errno));
    _fd.close();
    return;
  }
  _fileSize = static_cast<std::size_t>(st.st_size);
}

std::size_t File::readAt(std::span<std::byte> dst, std::uint64_t offset) const {
  while (true) {
    const auto nbRead = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (nbRead >= 0) {
      return static_cast<std::size_t>(nbRead);
    }
    if (errno == EINTR) {
      continue;
    }
    log::error("pread failed on fd # {} at offset {} (errno {}: {})", _fd.fd(), offset, errno, std::strerror(errno));
    return kError;
  }
}

std::string File::loadAllContent() const {
  if (!_fd) {
    throw std::runtime_error("File is not opened");
  }
  std::string content;
  content.resize_and_overwrite(_fileSize, [this](char* data, std::size_t capacity) {
    std::size_t pos = 0;
    while (pos < capacity) {
      const auto nbRead = readAt(std::as_writable_bytes(std::span<char>(data + pos, capacity - pos)), pos);
      if (nbRead == kError || nbRead == 0) {
        break;
      }
      pos += nbRead;
    }
    return pos;
  });
  if (content.size() != _fileSize) {
    throw std::runtime_error("File::loadAllContent short read");
  }
  return content;
}

}  // namespace fsroute
