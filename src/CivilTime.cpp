#include "CivilTime.hpp"
#include <cstdio>

namespace calsync {
namespace civil {

bool isLeapYear(int32_t year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int32_t daysInMonth(int32_t year, int32_t month) {
  static const int32_t kDays[12] = {31, 28, 31, 30, 31, 30,
                                    31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year))
    return 29;
  return kDays[month - 1];
}

// Howard Hinnant's days_from_civil / civil_from_days.
int64_t toDays(const CivilDate &date) {
  int64_t y = date.year;
  const int64_t m = date.month;
  const int64_t d = date.day;
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

CivilDate fromDays(int64_t days) {
  days += 719468;
  const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const int64_t doe = days - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t y = yoe + era * 400;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  const int64_t d = doy - (153 * mp + 2) / 5 + 1;
  const int64_t m = mp + (mp < 10 ? 3 : -9);
  CivilDate out;
  out.year = static_cast<int32_t>(y + (m <= 2));
  out.month = static_cast<int32_t>(m);
  out.day = static_cast<int32_t>(d);
  return out;
}

static int64_t floorDiv(int64_t a, int64_t b) {
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0)))
    --q;
  return q;
}

CivilDate dateOf(Instant instant) {
  return fromDays(floorDiv(instant, kSecondsPerDay));
}

int64_t secondsOfDay(Instant instant) {
  return instant - floorDiv(instant, kSecondsPerDay) * kSecondsPerDay;
}

Instant atTime(const CivilDate &date, int64_t secondsOfDay) {
  return toDays(date) * kSecondsPerDay + secondsOfDay;
}

Weekday weekdayOf(const CivilDate &date) {
  // 1970-01-01 was a Thursday (index 3 with Monday == 0).
  int64_t idx = (toDays(date) + 3) % 7;
  if (idx < 0)
    idx += 7;
  return static_cast<Weekday>(idx);
}

CivilDate addDays(const CivilDate &date, int64_t days) {
  return fromDays(toDays(date) + days);
}

CivilDate addMonthsClamped(const CivilDate &anchor, int64_t months) {
  int64_t monthIndex = static_cast<int64_t>(anchor.year) * 12 +
                       (anchor.month - 1) + months;
  CivilDate out;
  out.year = static_cast<int32_t>(floorDiv(monthIndex, 12));
  out.month = static_cast<int32_t>(monthIndex - floorDiv(monthIndex, 12) * 12) + 1;
  int32_t last = daysInMonth(out.year, out.month);
  out.day = anchor.day > last ? last : anchor.day;
  return out;
}

std::string formatDate(const CivilDate &date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date.year, date.month,
                date.day);
  return std::string(buf);
}

static bool validDate(const CivilDate &d) {
  return d.month >= 1 && d.month <= 12 && d.day >= 1 &&
         d.day <= daysInMonth(d.year, d.month);
}

std::optional<CivilDate> parseDate(const std::string &s) {
  CivilDate d;
  char trailing = 0;
  if (std::sscanf(s.c_str(), "%4d-%2d-%2d%c", &d.year, &d.month, &d.day,
                  &trailing) != 3)
    return std::nullopt;
  if (!validDate(d))
    return std::nullopt;
  return d;
}

std::string formatInstant(Instant instant) {
  CivilDate d = dateOf(instant);
  int64_t sod = secondsOfDay(instant);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", d.year,
                d.month, d.day, static_cast<int>(sod / 3600),
                static_cast<int>((sod / 60) % 60), static_cast<int>(sod % 60));
  return std::string(buf);
}

static std::optional<Instant> build(const CivilDate &d, int h, int m, int s) {
  if (!validDate(d) || h < 0 || h > 23 || m < 0 || m > 59 || s < 0 || s > 60)
    return std::nullopt;
  return atTime(d, h * 3600 + m * 60 + s);
}

std::optional<Instant> parseInstant(const std::string &s) {
  CivilDate d;
  int h = 0, m = 0, sec = 0;
  char z = 0;
  if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%c", &d.year, &d.month,
                  &d.day, &h, &m, &sec, &z) != 7 ||
      z != 'Z')
    return std::nullopt;
  return build(d, h, m, sec);
}

std::string formatCompact(Instant instant) {
  CivilDate d = dateOf(instant);
  int64_t sod = secondsOfDay(instant);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d%02d%02dT%02d%02d%02dZ", d.year,
                d.month, d.day, static_cast<int>(sod / 3600),
                static_cast<int>((sod / 60) % 60), static_cast<int>(sod % 60));
  return std::string(buf);
}

std::optional<Instant> parseCompact(const std::string &s) {
  CivilDate d;
  int h = 0, m = 0, sec = 0;
  char z = 0;
  if (std::sscanf(s.c_str(), "%4d%2d%2dT%2d%2d%2d%c", &d.year, &d.month,
                  &d.day, &h, &m, &sec, &z) != 7 ||
      z != 'Z')
    return std::nullopt;
  return build(d, h, m, sec);
}

} // namespace civil
} // namespace calsync
