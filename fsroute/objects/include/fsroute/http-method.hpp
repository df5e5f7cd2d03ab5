#pragma once

#include <bit>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace fsroute::http {

enum class Method : uint16_t {
  GET = 1 << 0,
  HEAD = 1 << 1,
  POST = 1 << 2,
  PUT = 1 << 3,
  DELETE = 1 << 4,
  CONNECT = 1 << 5,
  OPTIONS = 1 << 6,
  TRACE = 1 << 7,
  PATCH = 1 << 8
};

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 9;

using MethodBmp = uint16_t;

constexpr MethodBmp operator|(Method lhs, Method rhs) noexcept {
  using T = std::underlying_type_t<Method>;
  return static_cast<MethodBmp>(static_cast<T>(lhs) | static_cast<T>(rhs));
}

constexpr MethodBmp operator|(MethodBmp lhs, Method rhs) noexcept {
  using T = std::underlying_type_t<Method>;
  return static_cast<MethodBmp>(static_cast<T>(lhs) | static_cast<T>(rhs));
}

// Check if a method is allowed by mask.
constexpr bool IsMethodSet(MethodBmp mask, Method method) { return (mask & static_cast<MethodBmp>(method)) != 0U; }

constexpr MethodIdx MethodToIdx(Method method) {
  return static_cast<MethodIdx>(std::countr_zero(static_cast<MethodIdx>(method)));
}

constexpr Method MethodFromIdx(MethodIdx methodIdx) { return static_cast<http::Method>(1U << methodIdx); }

inline constexpr std::string_view kMethodStrings[] = {"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                      "CONNECT", "OPTIONS", "TRACE", "PATCH"};

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[MethodToIdx(method)]; }

// Methods answered by static files, templates and directory listings.
inline constexpr MethodBmp kReadOnlyMethods = Method::GET | Method::HEAD;

// Methods accepted by dynamic scripts.
inline constexpr MethodBmp kDynamicMethods =
    Method::GET | Method::HEAD | Method::POST | Method::PUT | Method::DELETE | Method::PATCH | Method::OPTIONS;

// Case-sensitive parse of a method token (RFC 7230 method names are case-sensitive).
constexpr std::optional<Method> MethodFromStr(std::string_view str) {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (kMethodStrings[methodIdx] == str) {
      return MethodFromIdx(methodIdx);
    }
  }
  return std::nullopt;
}

// Value of the Allow header for given mask, e.g. "GET, HEAD".
inline std::string AllowHeaderValue(MethodBmp mask) {
  std::string ret;
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    const Method method = MethodFromIdx(methodIdx);
    if (IsMethodSet(mask, method)) {
      if (!ret.empty()) {
        ret.append(", ");
      }
      ret.append(MethodToStr(method));
    }
  }
  return ret;
}

}  // namespace fsroute::http
