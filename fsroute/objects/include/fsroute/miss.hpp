#pragma once

#include <cstdint>
#include <string_view>

#include "fsroute/http-status-code.hpp"

namespace fsroute {

// Typed outcome of a failed normalization or resolution. Misses are values, never exceptions.
enum class MissReason : uint8_t { None, NotFound, Forbidden, MethodNotAllowed };

constexpr std::string_view MissReasonName(MissReason miss) noexcept {
  switch (miss) {
    case MissReason::None:
      return "none";
    case MissReason::NotFound:
      return "not-found";
    case MissReason::Forbidden:
      return "forbidden";
    case MissReason::MethodNotAllowed:
      return "method-not-allowed";
    default:
      return "unknown";
  }
}

constexpr http::StatusCode MissStatusCode(MissReason miss) noexcept {
  switch (miss) {
    case MissReason::Forbidden:
      return http::StatusCodeForbidden;
    case MissReason::MethodNotAllowed:
      return http::StatusCodeMethodNotAllowed;
    default:
      return http::StatusCodeNotFound;
  }
}

}  // namespace fsroute
