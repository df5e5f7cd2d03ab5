#include "fsroute/url-decode.hpp"

#include "fsroute/char-hexadecimal-converter.hpp"

namespace fsroute::url {

char* DecodeInPlace(char* first, const char* last, char plusAs, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    if (ch == '+') {
      *out++ = plusAs;
      continue;
    }
    if (ch != '%') {
      *out++ = ch;
      continue;
    }
    if (last - first < 3) {
      if (strictInvalid) {
        return nullptr;
      }
      *out++ = '%';
      continue;
    }
    const int hi = from_hex_digit(first[1]);
    const int lo = from_hex_digit(first[2]);
    if (hi < 0 || lo < 0) {
      if (strictInvalid) {
        return nullptr;
      }
      *out++ = '%';
      continue;
    }
    *out++ = static_cast<char>((hi << 4) | lo);
    first += 2;
  }
  return out;
}

}  // namespace fsroute::url
