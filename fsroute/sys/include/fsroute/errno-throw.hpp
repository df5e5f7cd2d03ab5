#pragma once

#include <cerrno>
#include <format>
#include <system_error>
#include <utility>

namespace fsroute {

// Throws std::system_error carrying the current errno, read before the message is formatted.
// Example: throw_errno("epoll_ctl ADD failed (fd # {})", fd);
template <class... Args>
[[noreturn]] void throw_errno(std::format_string<Args...> fmt, Args&&... args) {
  const int err = errno;
  throw std::system_error(err, std::system_category(), std::format(fmt, std::forward<Args>(args)...));
}

}  // namespace fsroute
