#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace calsync {

// Seconds since the Unix epoch, UTC.
using Instant = std::int64_t;

// Injected wherever "now" matters so tests can pin time.
using Clock = std::function<Instant()>;
Instant systemNow();

enum class Frequency { Daily, Weekly, Monthly, Yearly, Custom };

enum class Termination { None, EndDate, Count };

enum class Weekday {
  Monday = 0,
  Tuesday,
  Wednesday,
  Thursday,
  Friday,
  Saturday,
  Sunday
};

struct RecurrenceRule {
  Frequency frequency = Frequency::Daily;
  int32_t interval = 1;
  Termination termination = Termination::None;
  std::optional<Instant> until; // Termination::EndDate, exclusive
  std::optional<int32_t> count; // Termination::Count
  // Only valid for Frequency::Custom. Exactly one of the two is non-empty:
  // weekdays -> every `interval` weeks, monthDays -> every `interval` months.
  std::vector<Weekday> weekdays;
  std::vector<int32_t> monthDays;
};

struct CivilDate {
  int32_t year = 1970;
  int32_t month = 1; // 1..12
  int32_t day = 1;   // 1..31
};

bool operator==(const CivilDate &a, const CivilDate &b);
bool operator!=(const CivilDate &a, const CivilDate &b);
bool operator<(const CivilDate &a, const CivilDate &b);

enum class ItemKind { Event, Task };

enum class OccurrenceStatus { Generated, Modified, Cancelled };

// One rule with the anchor it expands from. A series holds one or more
// segments; the last one is open-ended, earlier ones are closed at `until`.
struct RuleSegment {
  RecurrenceRule rule;
  Instant anchor = 0;
  int64_t durationSeconds = 0;
  std::optional<Instant> effectiveUntil;
};

struct SeriesPayload {
  ItemKind kind = ItemKind::Event;
  std::string title;
  std::string notes;
  std::string category;
  bool recurring = true;
  std::vector<RuleSegment> segments;
};

enum class ExceptionKind { Replace, Cancel };

struct OccurrenceException {
  std::string seriesId;
  CivilDate originalDate;
  ExceptionKind kind = ExceptionKind::Replace;
  Instant start = 0;
  Instant end = 0;
  std::optional<std::string> title;
  bool completed = false;
};

struct Occurrence {
  std::string id; // "<seriesId>@YYYY-MM-DD" of the original date
  std::string seriesId;
  int32_t sequence = 0;
  CivilDate originalDate;
  Instant start = 0;
  Instant end = 0;
  OccurrenceStatus status = OccurrenceStatus::Generated;
  ItemKind kind = ItemKind::Event;
  std::string title;
  bool completed = false;
};

enum class Origin { Local, RemoteBackend, ExternalCalendar };

enum class RecordType { Series, Exception };

struct SyncableRecord {
  std::string id;
  RecordType type = RecordType::Series;
  Origin origin = Origin::Local;
  int64_t version = 0;
  Instant lastModified = 0;
  bool deleted = false;
  std::string payload; // JSON document, see Serialization.hpp
};

enum class ChangeOp { Create, Update, Delete };

struct PendingChange {
  int64_t changeId = 0;
  Origin target = Origin::RemoteBackend;
  ChangeOp op = ChangeOp::Update;
  std::string recordId;
  SyncableRecord snapshot;
  Instant createdAt = 0;
  int32_t retryCount = 0;
  Instant nextAttemptAt = 0;
  bool failed = false;
  std::string lastError;
};

enum class ConflictPolicy { NewerWins, LocalWins, RemoteWins };

struct ScheduledNotification {
  std::string occurrenceId;
  int64_t offsetSeconds = 0;
  Instant trigger = 0;
  std::string channel;
  std::string title;
};

enum class SyncState { Idle, Pulling, Reconciling, Pushing, Failed };

enum class AuthorizationState { NotRequested, Denied, ReadWrite, WriteOnly };

enum class SyncErrorKind {
  Transient,
  AuthorizationDenied,
  Malformed,
  Storage,
  Cancelled
};

struct SyncError {
  SyncErrorKind kind = SyncErrorKind::Transient;
  std::string message;
};

struct SyncStats {
  int32_t recordsDownloaded = 0;
  int32_t recordsUploaded = 0;
  int32_t recordsDeleted = 0;
  int32_t conflictsResolved = 0;
  int32_t errors = 0;
  std::optional<Instant> lastSyncAt;
};

struct SyncStatus {
  SyncState state = SyncState::Idle;
  std::string failureReason;
  bool suspended = false;
  bool pendingRequest = false;
  int32_t consecutiveFailures = 0;
  SyncStats stats;
};

std::string toString(Origin origin);
std::optional<Origin> originFromString(const std::string &value);
std::string toString(ChangeOp op);
std::optional<ChangeOp> changeOpFromString(const std::string &value);
std::string toString(ConflictPolicy policy);
std::optional<ConflictPolicy> conflictPolicyFromString(const std::string &value);
std::string toString(SyncState state);
std::string toString(AuthorizationState state);
std::optional<AuthorizationState>
authorizationStateFromString(const std::string &value);
std::string toString(RecordType type);
std::optional<RecordType> recordTypeFromString(const std::string &value);

} // namespace calsync
