#pragma once

#include "types.hpp"
#include <optional>
#include <string>

namespace calsync {
namespace civil {

constexpr int64_t kSecondsPerDay = 86400;

bool isLeapYear(int32_t year);
int32_t daysInMonth(int32_t year, int32_t month);

// Days since 1970-01-01 (proleptic Gregorian).
int64_t toDays(const CivilDate &date);
CivilDate fromDays(int64_t days);

CivilDate dateOf(Instant instant);
int64_t secondsOfDay(Instant instant);
Instant atTime(const CivilDate &date, int64_t secondsOfDay);

Weekday weekdayOf(const CivilDate &date);
CivilDate addDays(const CivilDate &date, int64_t days);
// Moves `months` months forward and clamps `day` to the target month length.
CivilDate addMonthsClamped(const CivilDate &anchor, int64_t months);

std::string formatDate(const CivilDate &date);             // 2026-01-31
std::optional<CivilDate> parseDate(const std::string &s);  // 2026-01-31
std::string formatInstant(Instant instant);                // 2026-01-31T10:00:00Z
std::optional<Instant> parseInstant(const std::string &s); // same format
std::string formatCompact(Instant instant);                // 20260131T100000Z
std::optional<Instant> parseCompact(const std::string &s);

} // namespace civil
} // namespace calsync
