#include "fsroute/timestring.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iterator>
#include <string_view>

#include "fsroute/simple-charconv.hpp"
#include "fsroute/timedef.hpp"

namespace fsroute {

namespace {

constexpr bool IsSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; }

constexpr bool IsDigit(char ch) { return ch >= '0' && ch <= '9'; }

}  // namespace

SysTimePoint TryParseTimeRFC7231(std::string_view value) {
  while (!value.empty() && IsSpace(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && IsSpace(value.back())) {
    value.remove_suffix(1);
  }
  if (value.size() != kRFC7231DateStrLen) {
    return kInvalidTimePoint;
  }

  // "Sun, 06 Nov 1994 08:49:37 GMT"
  const char* ptr = value.data();
  if (ptr[3] != ',' || ptr[4] != ' ' || ptr[7] != ' ' || ptr[11] != ' ' || ptr[16] != ' ' || ptr[19] != ':' ||
      ptr[22] != ':' || ptr[25] != ' ') {
    return kInvalidTimePoint;
  }
  static constexpr std::size_t kDigitPositions[] = {5, 6, 12, 13, 14, 15, 17, 18, 20, 21, 23, 24};
  if (!std::ranges::all_of(kDigitPositions, [ptr](std::size_t pos) { return IsDigit(ptr[pos]); })) {
    return kInvalidTimePoint;
  }
  if (read3Chars(ptr + 26) != read3Chars("GMT")) {
    return kInvalidTimePoint;
  }

  static constexpr unsigned kMonths[]{
      read3Chars("Jan"), read3Chars("Feb"), read3Chars("Mar"), read3Chars("Apr"),
      read3Chars("May"), read3Chars("Jun"), read3Chars("Jul"), read3Chars("Aug"),
      read3Chars("Sep"), read3Chars("Oct"), read3Chars("Nov"), read3Chars("Dec"),
  };
  static constexpr unsigned kWeekdays[]{read3Chars("Sun"), read3Chars("Mon"), read3Chars("Tue"), read3Chars("Wed"),
                                        read3Chars("Thu"), read3Chars("Fri"), read3Chars("Sat")};

  const auto monthIt = std::ranges::find(kMonths, read3Chars(ptr + 8));
  const auto weekdayIt = std::ranges::find(kWeekdays, read3Chars(ptr));
  if (monthIt == std::end(kMonths) || weekdayIt == std::end(kWeekdays)) {
    return kInvalidTimePoint;
  }

  const int hours = read2(ptr + 17);
  const int minutes = read2(ptr + 20);
  const int seconds = read2(ptr + 23);
  if (hours > 23 || minutes > 59 || seconds > 60) {
    return kInvalidTimePoint;
  }

  const std::chrono::year_month_day ymd{
      std::chrono::year{read4(ptr + 12)},
      std::chrono::month{static_cast<unsigned>(std::distance(std::begin(kMonths), monthIt)) + 1U},
      std::chrono::day{static_cast<unsigned>(read2(ptr + 5))}};
  if (!ymd.ok()) {
    return kInvalidTimePoint;
  }

  const std::chrono::sys_days dayPoint{ymd};
  if (static_cast<unsigned>(std::distance(std::begin(kWeekdays), weekdayIt)) !=
      std::chrono::weekday{dayPoint}.c_encoding()) {
    return kInvalidTimePoint;
  }

  return dayPoint + std::chrono::hours{hours} + std::chrono::minutes{minutes} + std::chrono::seconds{seconds};
}

}  // namespace fsroute
