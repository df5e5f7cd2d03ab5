#pragma once

#include <concepts>

namespace fsroute {

// Fixed-width decimal writers / readers used by the HTTP date formatter.
// No validation is done: callers check digits beforehand.

constexpr auto write2(auto buf, std::integral auto value) {
  *buf = static_cast<char>('0' + (value / 10));
  *++buf = static_cast<char>('0' + (value % 10));
  return ++buf;
}

constexpr auto write4(auto buf, std::integral auto value) {
  *buf = static_cast<char>('0' + (value / 1000));
  *++buf = static_cast<char>('0' + ((value / 100) % 10));
  *++buf = static_cast<char>('0' + ((value / 10) % 10));
  *++buf = static_cast<char>('0' + (value % 10));
  return ++buf;
}

constexpr auto copy3(auto des, auto src) {
  *des = src[0];
  *++des = src[1];
  *++des = src[2];
  return ++des;
}

constexpr int read2(const char* ptr) { return ((ptr[0] - '0') * 10) + (ptr[1] - '0'); }

constexpr int read4(const char* ptr) {
  return ((ptr[0] - '0') * 1000) + ((ptr[1] - '0') * 100) + ((ptr[2] - '0') * 10) + (ptr[3] - '0');
}

// Packs 3 chars into an integer so that fixed tokens ("GMT", "Jan") compare in one instruction.
constexpr unsigned read3Chars(const char* ptr) {
  return (static_cast<unsigned>(static_cast<unsigned char>(ptr[0])) << 16U) |
         (static_cast<unsigned>(static_cast<unsigned char>(ptr[1])) << 8U) |
         static_cast<unsigned>(static_cast<unsigned char>(ptr[2]));
}

}  // namespace fsroute
