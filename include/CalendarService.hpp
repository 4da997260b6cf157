#pragma once
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace calsync {

// One RRULE with the DTSTART it expands from. A series edited with a new
// rule carries several, the earlier ones closed by `effectiveUntil`.
struct CalendarRule {
  Instant dtstart = 0;
  int64_t durationSeconds = 0;
  std::string rrule; // empty for a single, non-repeating event
  std::optional<Instant> effectiveUntil;
};

/**
 * An event as the system calendar stores it. A series master has no
 * recurrenceId; a per-instance override carries the original date of the
 * instance it replaces and either new times or `cancelledInstance`.
 */
struct CalendarEvent {
  std::string uid;
  std::optional<CivilDate> recurrenceId;
  int64_t sequence = 0;
  Instant lastModified = 0;
  bool deleted = false;
  bool cancelledInstance = false;
  std::string title;
  std::string notes;
  std::string category;
  Instant start = 0;
  Instant end = 0;
  std::vector<CalendarRule> rules;
};

struct CalendarChanges {
  std::optional<SyncError> error;
  std::vector<CalendarEvent> events;
  std::string syncToken;
  bool hasMore = false;
};

struct CalendarWriteResult {
  std::optional<SyncError> error;
  bool conflict = false;
  std::optional<CalendarEvent> current;
};

// System calendar access as seen from this process.
class CalendarService {
public:
  virtual ~CalendarService() = default;

  virtual AuthorizationState authorizationState() = 0;
  // Prompts (or asks the bridge to prompt) for access; returns the outcome.
  virtual AuthorizationState requestAccess() = 0;

  virtual CalendarChanges listChangedEvents(const std::string &syncToken) = 0;
  virtual CalendarWriteResult upsertEvent(const CalendarEvent &event) = 0;
  virtual CalendarWriteResult
  deleteEvent(const std::string &uid,
              const std::optional<CivilDate> &recurrenceId,
              int64_t sequence) = 0;

  virtual void cancel() = 0;
  virtual void resume() = 0;
};

} // namespace calsync
