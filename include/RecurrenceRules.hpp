#pragma once

#include "types.hpp"
#include <optional>
#include <string>

namespace calsync {

enum class RuleErrorCode {
  ZeroInterval,
  EndBeforeAnchor,
  MissingEndDate,
  NonPositiveCount,
  MissingConstraints,
  AmbiguousConstraints,
  UnexpectedConstraints,
  InvalidMonthDay,
  UnparsableRule,
  MissingSegments
};

struct ValidationError {
  RuleErrorCode code;
  std::string message;
};

// Returns the first problem found, or nullopt if the rule can be expanded
// from `anchor`.
std::optional<ValidationError> validateRule(const RecurrenceRule &rule,
                                            Instant anchor);

// Checks every segment of a recurring series against its own anchor.
std::optional<ValidationError> validateSeries(const SeriesPayload &series);

// RFC 5545 RRULE value, e.g. "FREQ=WEEKLY;INTERVAL=2;BYDAY=MO,WE;COUNT=8".
// parseRRule rejects BYMONTHDAY values outside 1..31.
std::string toRRule(const RecurrenceRule &rule);
std::optional<RecurrenceRule> parseRRule(const std::string &text);

} // namespace calsync
