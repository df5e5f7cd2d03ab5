#pragma once

#include <cstddef>
#include <string_view>

#include "fsroute/toupperlower.hpp"

namespace fsroute {

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  if (value.size() < prefix.size()) {
    return false;
  }
  return CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

}  // namespace fsroute
