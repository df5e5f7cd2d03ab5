#pragma once

#include <string>
#include <string_view>

namespace fsroute {

// Locale independent ASCII lower casing.
constexpr char tolower(char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<char>(ch | 0x20);
  }
  return ch;
}

inline std::string ToLowerAscii(std::string_view str) {
  std::string ret(str.size(), '\0');
  for (std::string::size_type pos = 0; pos < str.size(); ++pos) {
    ret[pos] = tolower(str[pos]);
  }
  return ret;
}

}  // namespace fsroute
