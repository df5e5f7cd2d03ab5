#pragma once

namespace fsroute {

// RAII owner of a POSIX file descriptor.
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  explicit BaseFd(int fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd& other) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd& other) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Release ownership of the underlying fd without closing it.
  [[nodiscard]] int release() noexcept;

  // Close the descriptor now. Idempotent.
  void close() noexcept;

  bool operator==(const BaseFd&) const noexcept = default;

 private:
  int _fd;
};

}  // namespace fsroute
