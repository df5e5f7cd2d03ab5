#pragma once

#include <string_view>

namespace fsroute {

// Optional whitespace of HTTP field values and list elements: SP and HTAB.
inline constexpr std::string_view kOws = " \t";

// 'value' without its leading and trailing optional whitespace.
constexpr std::string_view TrimOws(std::string_view value) noexcept {
  const auto first = value.find_first_not_of(kOws);
  if (first == std::string_view::npos) {
    return {};
  }
  return value.substr(first, value.find_last_not_of(kOws) + 1U - first);
}

}  // namespace fsroute
