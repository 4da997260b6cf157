#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace calsync {

struct SeriesAnchor {
  std::string seriesId;
  Instant start = 0;
  int64_t durationSeconds = 0;
  ItemKind kind = ItemKind::Event;
  std::string title;
};

/**
 * Expands `rule` from `anchor` into the occurrences whose generated start
 * falls in [windowStart, windowEnd), ordered by sequence index.
 *
 * The sequence index is counted from the anchor, so count-terminated rules
 * give the same answer whatever the window. Monthly and yearly dates that do
 * not exist in the target month are clamped to its last day. Exceptions for
 * the series replace or drop the generated date they are keyed on.
 *
 * The rule must have passed validateRule(); a non-positive interval yields an
 * empty list. Pure, safe to call concurrently.
 */
std::vector<Occurrence> expand(const RecurrenceRule &rule,
                               const SeriesAnchor &anchor, Instant windowStart,
                               Instant windowEnd,
                               const std::vector<OccurrenceException> &exceptions);

// Expands every rule segment of a series, each clipped to its own range.
// Sequence numbers continue across segments.
std::vector<Occurrence>
expandSeries(const std::string &seriesId, const SeriesPayload &series,
             Instant windowStart, Instant windowEnd,
             const std::vector<OccurrenceException> &exceptions);

std::string occurrenceId(const std::string &seriesId, const CivilDate &date);

} // namespace calsync
