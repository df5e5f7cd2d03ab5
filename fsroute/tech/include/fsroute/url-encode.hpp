#pragma once

#include <string>
#include <string_view>

#include "fsroute/char-hexadecimal-converter.hpp"

namespace fsroute {

/// Appends 'data' to 'out', percent-encoding (upper case hex) every char for which isNotEncodedFunc(ch) is false.
template <class IsNotEncodedFunc>
void URLEncodeAppend(std::string_view data, IsNotEncodedFunc isNotEncodedFunc, std::string &out) {
  for (char ch : data) {
    if (isNotEncodedFunc(ch)) {
      out.push_back(ch);
    } else {
      char buf[3];
      buf[0] = '%';
      to_upper_hex(ch, buf + 1);
      out.append(buf, sizeof(buf));
    }
  }
}

}  // namespace fsroute
