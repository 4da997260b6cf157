#include "RecurrenceRules.hpp"
#include "CivilTime.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace calsync {

namespace {

const char *const kDayCodes[7] = {"MO", "TU", "WE", "TH", "FR", "SA", "SU"};

std::vector<std::string> split(const std::string &s, char sep) {
  std::vector<std::string> parts;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, sep)) {
    if (!item.empty())
      parts.push_back(item);
  }
  return parts;
}

std::optional<int32_t> toInt(const std::string &s) {
  try {
    size_t used = 0;
    int value = std::stoi(s, &used);
    if (used != s.size())
      return std::nullopt;
    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

} // namespace

std::optional<ValidationError> validateRule(const RecurrenceRule &rule,
                                            Instant anchor) {
  if (rule.interval <= 0)
    return ValidationError{RuleErrorCode::ZeroInterval,
                           "interval must be a positive integer"};

  switch (rule.termination) {
  case Termination::None:
    break;
  case Termination::EndDate:
    if (!rule.until)
      return ValidationError{RuleErrorCode::MissingEndDate,
                             "end-date termination without an end date"};
    if (*rule.until <= anchor)
      return ValidationError{RuleErrorCode::EndBeforeAnchor,
                             "end date " + civil::formatInstant(*rule.until) +
                                 " is not after the anchor " +
                                 civil::formatInstant(anchor)};
    break;
  case Termination::Count:
    if (!rule.count || *rule.count <= 0)
      return ValidationError{RuleErrorCode::NonPositiveCount,
                             "occurrence count must be positive"};
    break;
  }

  if (rule.frequency == Frequency::Custom) {
    if (rule.weekdays.empty() && rule.monthDays.empty())
      return ValidationError{
          RuleErrorCode::MissingConstraints,
          "custom frequency needs weekday or day-of-month constraints"};
    if (!rule.weekdays.empty() && !rule.monthDays.empty())
      return ValidationError{
          RuleErrorCode::AmbiguousConstraints,
          "custom frequency takes weekdays or month days, not both"};
    for (int32_t day : rule.monthDays) {
      if (day < 1 || day > 31)
        return ValidationError{RuleErrorCode::InvalidMonthDay,
                               "day of month out of range: " +
                                   std::to_string(day)};
    }
  } else if (!rule.weekdays.empty() || !rule.monthDays.empty()) {
    return ValidationError{
        RuleErrorCode::UnexpectedConstraints,
        "weekday/day-of-month constraints require custom frequency"};
  }
  return std::nullopt;
}

std::optional<ValidationError> validateSeries(const SeriesPayload &series) {
  if (series.segments.empty())
    return ValidationError{RuleErrorCode::MissingSegments,
                           "series has no rule segments"};
  if (!series.recurring)
    return std::nullopt;
  for (const auto &segment : series.segments) {
    if (auto error = validateRule(segment.rule, segment.anchor))
      return error;
  }
  return std::nullopt;
}

std::string toRRule(const RecurrenceRule &rule) {
  std::ostringstream out;
  switch (rule.frequency) {
  case Frequency::Daily:
    out << "FREQ=DAILY";
    break;
  case Frequency::Weekly:
    out << "FREQ=WEEKLY";
    break;
  case Frequency::Monthly:
    out << "FREQ=MONTHLY";
    break;
  case Frequency::Yearly:
    out << "FREQ=YEARLY";
    break;
  case Frequency::Custom:
    out << (rule.weekdays.empty() ? "FREQ=MONTHLY" : "FREQ=WEEKLY");
    break;
  }
  if (rule.interval != 1)
    out << ";INTERVAL=" << rule.interval;
  if (rule.termination == Termination::Count && rule.count)
    out << ";COUNT=" << *rule.count;
  if (rule.termination == Termination::EndDate && rule.until)
    out << ";UNTIL=" << civil::formatCompact(*rule.until);
  if (!rule.weekdays.empty()) {
    out << ";BYDAY=";
    for (size_t i = 0; i < rule.weekdays.size(); ++i) {
      out << (i ? "," : "") << kDayCodes[static_cast<int>(rule.weekdays[i])];
    }
  }
  if (!rule.monthDays.empty()) {
    out << ";BYMONTHDAY=";
    for (size_t i = 0; i < rule.monthDays.size(); ++i) {
      out << (i ? "," : "") << rule.monthDays[i];
    }
  }
  return out.str();
}

std::optional<RecurrenceRule> parseRRule(const std::string &text) {
  RecurrenceRule rule;
  bool haveFreq = false;
  std::string value = text;
  if (value.rfind("RRULE:", 0) == 0)
    value = value.substr(6);

  for (const auto &part : split(value, ';')) {
    auto eq = part.find('=');
    if (eq == std::string::npos)
      return std::nullopt;
    std::string key = part.substr(0, eq);
    std::string val = part.substr(eq + 1);
    std::transform(key.begin(), key.end(), key.begin(), ::toupper);
    std::transform(val.begin(), val.end(), val.begin(), ::toupper);

    if (key == "FREQ") {
      haveFreq = true;
      if (val == "DAILY")
        rule.frequency = Frequency::Daily;
      else if (val == "WEEKLY")
        rule.frequency = Frequency::Weekly;
      else if (val == "MONTHLY")
        rule.frequency = Frequency::Monthly;
      else if (val == "YEARLY")
        rule.frequency = Frequency::Yearly;
      else
        return std::nullopt;
    } else if (key == "INTERVAL") {
      auto n = toInt(val);
      if (!n)
        return std::nullopt;
      rule.interval = *n;
    } else if (key == "COUNT") {
      auto n = toInt(val);
      if (!n)
        return std::nullopt;
      rule.termination = Termination::Count;
      rule.count = *n;
    } else if (key == "UNTIL") {
      auto until = civil::parseCompact(val);
      if (!until)
        return std::nullopt;
      rule.termination = Termination::EndDate;
      rule.until = *until;
    } else if (key == "BYDAY") {
      for (const auto &code : split(val, ',')) {
        auto it = std::find(std::begin(kDayCodes), std::end(kDayCodes), code);
        if (it == std::end(kDayCodes))
          return std::nullopt;
        rule.weekdays.push_back(
            static_cast<Weekday>(std::distance(std::begin(kDayCodes), it)));
      }
    } else if (key == "BYMONTHDAY") {
      for (const auto &day : split(val, ',')) {
        auto n = toInt(day);
        // Negative (from the month end) days have no counterpart.
        if (!n || *n < 1 || *n > 31)
          return std::nullopt;
        rule.monthDays.push_back(*n);
      }
    }
    // WKST and other parts have no counterpart in RecurrenceRule.
  }

  if (!haveFreq)
    return std::nullopt;
  if (!rule.weekdays.empty() || !rule.monthDays.empty())
    rule.frequency = Frequency::Custom;
  return rule;
}

} // namespace calsync
