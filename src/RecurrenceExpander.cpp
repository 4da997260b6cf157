#include "RecurrenceExpander.hpp"
#include "CivilTime.hpp"
#include <algorithm>
#include <map>

namespace calsync {

namespace {

int64_t ceilDiv(int64_t a, int64_t b) {
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) == (b < 0)))
    ++q;
  return q;
}

int64_t monthSerial(const CivilDate &d) {
  return static_cast<int64_t>(d.year) * 12 + (d.month - 1);
}

// Calls visit(index, date) for each generated date, in increasing order,
// until it returns false. For the fixed-step frequencies the index equals the
// period number, so generation may start at `firstPeriod` instead of zero.
template <class Visit>
void generateDates(const RecurrenceRule &rule, const CivilDate &anchor,
                   int64_t firstPeriod, Visit visit) {
  const int64_t n = rule.interval;
  switch (rule.frequency) {
  case Frequency::Daily:
  case Frequency::Weekly: {
    const int64_t step = rule.frequency == Frequency::Daily ? n : 7 * n;
    for (int64_t k = firstPeriod;; ++k) {
      if (!visit(k, civil::addDays(anchor, k * step)))
        return;
    }
  }
  case Frequency::Monthly:
  case Frequency::Yearly: {
    const int64_t months = rule.frequency == Frequency::Monthly ? n : 12 * n;
    for (int64_t k = firstPeriod;; ++k) {
      if (!visit(k, civil::addMonthsClamped(anchor, k * months)))
        return;
    }
  }
  case Frequency::Custom:
    break;
  }

  int64_t index = 0;
  if (!rule.weekdays.empty()) {
    std::vector<int> offsets;
    for (Weekday wd : rule.weekdays)
      offsets.push_back(static_cast<int>(wd));
    std::sort(offsets.begin(), offsets.end());
    offsets.erase(std::unique(offsets.begin(), offsets.end()), offsets.end());

    const CivilDate weekStart = civil::addDays(
        anchor, -static_cast<int64_t>(civil::weekdayOf(anchor)));
    for (int64_t period = 0;; ++period) {
      const CivilDate base = civil::addDays(weekStart, period * 7 * n);
      for (int offset : offsets) {
        CivilDate date = civil::addDays(base, offset);
        if (date < anchor)
          continue;
        if (!visit(index++, date))
          return;
      }
    }
  }

  if (!rule.monthDays.empty()) {
    std::vector<int32_t> days;
    for (int32_t day : rule.monthDays) {
      if (day >= 1 && day <= 31)
        days.push_back(day);
    }
    if (days.empty())
      return;
    std::sort(days.begin(), days.end());
    days.erase(std::unique(days.begin(), days.end()), days.end());

    const CivilDate firstOfMonth{anchor.year, anchor.month, 1};
    for (int64_t period = 0;; ++period) {
      const CivilDate month = civil::addMonthsClamped(firstOfMonth, period * n);
      const int32_t last = civil::daysInMonth(month.year, month.month);
      int32_t previous = 0;
      for (int32_t day : days) {
        const int32_t clamped = std::min(day, last);
        if (clamped == previous)
          continue;
        previous = clamped;
        CivilDate date{month.year, month.month, clamped};
        if (date < anchor)
          continue;
        if (!visit(index++, date))
          return;
      }
    }
  }
}

} // namespace

std::string occurrenceId(const std::string &seriesId, const CivilDate &date) {
  return seriesId + "@" + civil::formatDate(date);
}

std::vector<Occurrence>
expand(const RecurrenceRule &rule, const SeriesAnchor &anchor,
       Instant windowStart, Instant windowEnd,
       const std::vector<OccurrenceException> &exceptions) {
  std::vector<Occurrence> out;
  if (rule.interval <= 0 || windowEnd <= windowStart)
    return out;
  if (rule.frequency == Frequency::Custom && rule.weekdays.empty() &&
      rule.monthDays.empty())
    return out;
  if (rule.termination == Termination::Count && (!rule.count || *rule.count <= 0))
    return out;

  std::map<std::string, const OccurrenceException *> byDate;
  for (const auto &ex : exceptions) {
    if (ex.seriesId == anchor.seriesId)
      byDate[civil::formatDate(ex.originalDate)] = &ex;
  }

  const CivilDate anchorDate = civil::dateOf(anchor.start);
  const int64_t timeOfDay = civil::secondsOfDay(anchor.start);

  int64_t firstPeriod = 0;
  if (windowStart > anchor.start) {
    switch (rule.frequency) {
    case Frequency::Daily:
      firstPeriod = ceilDiv(windowStart - anchor.start,
                            rule.interval * civil::kSecondsPerDay);
      break;
    case Frequency::Weekly:
      firstPeriod = ceilDiv(windowStart - anchor.start,
                            7 * rule.interval * civil::kSecondsPerDay);
      break;
    case Frequency::Monthly:
    case Frequency::Yearly: {
      const int64_t months =
          rule.frequency == Frequency::Monthly ? rule.interval : 12 * rule.interval;
      const int64_t elapsed =
          monthSerial(civil::dateOf(windowStart)) - monthSerial(anchorDate);
      firstPeriod = std::max<int64_t>(0, elapsed / months - 1);
      break;
    }
    case Frequency::Custom:
      break;
    }
  }

  generateDates(rule, anchorDate, firstPeriod,
                [&](int64_t index, const CivilDate &date) {
                  if (rule.termination == Termination::Count &&
                      index >= *rule.count)
                    return false;
                  const Instant start = civil::atTime(date, timeOfDay);
                  if (rule.termination == Termination::EndDate && rule.until &&
                      start >= *rule.until)
                    return false;
                  if (start >= windowEnd)
                    return false;
                  if (start < windowStart)
                    return true;

                  Occurrence occ;
                  occ.id = occurrenceId(anchor.seriesId, date);
                  occ.seriesId = anchor.seriesId;
                  occ.sequence = static_cast<int32_t>(index);
                  occ.originalDate = date;
                  occ.start = start;
                  occ.end = start + anchor.durationSeconds;
                  occ.kind = anchor.kind;
                  occ.title = anchor.title;

                  auto it = byDate.find(civil::formatDate(date));
                  if (it != byDate.end()) {
                    const OccurrenceException &ex = *it->second;
                    if (ex.kind == ExceptionKind::Cancel)
                      return true;
                    occ.status = OccurrenceStatus::Modified;
                    occ.start = ex.start;
                    occ.end = ex.end;
                    if (ex.title)
                      occ.title = *ex.title;
                    occ.completed = ex.completed;
                  }
                  out.push_back(std::move(occ));
                  return true;
                });
  return out;
}

std::vector<Occurrence>
expandSeries(const std::string &seriesId, const SeriesPayload &series,
             Instant windowStart, Instant windowEnd,
             const std::vector<OccurrenceException> &exceptions) {
  std::vector<Occurrence> out;
  int64_t sequenceOffset = 0;

  for (const auto &segment : series.segments) {
    RecurrenceRule rule = segment.rule;
    if (!series.recurring) {
      rule = RecurrenceRule{};
      rule.termination = Termination::Count;
      rule.count = 1;
    }
    SeriesAnchor anchor{seriesId, segment.anchor, segment.durationSeconds,
                        series.kind, series.title};

    Instant segmentEnd = windowEnd;
    if (segment.effectiveUntil)
      segmentEnd = std::min(windowEnd, *segment.effectiveUntil);

    if (segmentEnd > windowStart) {
      for (auto &occ :
           expand(rule, anchor, windowStart, segmentEnd, exceptions)) {
        occ.sequence += static_cast<int32_t>(sequenceOffset);
        out.push_back(std::move(occ));
      }
    }

    if (segment.effectiveUntil && *segment.effectiveUntil > segment.anchor) {
      sequenceOffset += static_cast<int64_t>(
          expand(rule, anchor, segment.anchor, *segment.effectiveUntil, {})
              .size());
    }
  }
  return out;
}

} // namespace calsync
