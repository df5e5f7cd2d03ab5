#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

#include "fsroute/simple-charconv.hpp"
#include "fsroute/timedef.hpp"

namespace fsroute {

inline constexpr std::size_t kRFC7231DateStrLen = 29;
inline constexpr SysTimePoint kInvalidTimePoint = SysTimePoint::max();

/// Format a time point to an RFC7231 IMF-fixdate string (e.g. "Sun, 06 Nov 1994 08:49:37 GMT").
/// Buffer must have space for at least kRFC7231DateStrLen characters (no null terminator added).
/// Returns pointer past last written char.
constexpr auto TimeToStringRFC7231(SysTimePoint tp, auto out) {
  using namespace std::chrono;
  static constexpr const char* const kWeekdays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  static constexpr const char* const kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                  "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  const sys_seconds secTp = time_point_cast<seconds>(tp);
  const auto dayPoint = floor<days>(secTp);
  const year_month_day ymd{dayPoint};
  const weekday wd{dayPoint};
  const hh_mm_ss hms{secTp - dayPoint};
  out = copy3(out, kWeekdays[wd.c_encoding()]);
  *out = ',';
  *++out = ' ';
  out = write2(++out, static_cast<unsigned>(ymd.day()));
  *out = ' ';
  out = copy3(++out, kMonths[static_cast<unsigned>(ymd.month()) - 1]);
  *out = ' ';
  out = write4(++out, static_cast<int>(ymd.year()));
  *out = ' ';
  out = write2(++out, hms.hours().count());
  *out = ':';
  out = write2(++out, hms.minutes().count());
  *out = ':';
  out = write2(++out, hms.seconds().count());
  *out = ' ';
  return copy3(++out, "GMT");
}

// Parse a strict IMF-fixdate. Surrounding whitespace is tolerated.
// Returns kInvalidTimePoint on any format or calendar error (including a weekday not matching the date).
SysTimePoint TryParseTimeRFC7231(std::string_view value);

}  // namespace fsroute
