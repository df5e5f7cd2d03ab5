#pragma once

namespace fsroute {

/// Writes the 2 upper case hexadecimal digits of 'ch' to 'buf' and returns a pointer past them.
///  ',' -> "2C"
constexpr char *to_upper_hex(unsigned char ch, char *buf) {
  constexpr const char *const kHexits = "0123456789ABCDEF";

  buf[0] = kHexits[ch >> 4U];
  buf[1] = kHexits[ch & 0x0F];

  return buf + 2;
}

constexpr char *to_upper_hex(char ch, char *buf) { return to_upper_hex(static_cast<unsigned char>(ch), buf); }

/// Decode a single hexadecimal digit. Returns -1 if invalid.
constexpr int from_hex_digit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

}  // namespace fsroute
