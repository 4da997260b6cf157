#include "types.hpp"
#include <chrono>
#include <tuple>

namespace calsync {

Instant systemNow() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

bool operator==(const CivilDate &a, const CivilDate &b) {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const CivilDate &a, const CivilDate &b) { return !(a == b); }

bool operator<(const CivilDate &a, const CivilDate &b) {
  return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
}

std::string toString(Origin origin) {
  switch (origin) {
  case Origin::Local:
    return "local";
  case Origin::RemoteBackend:
    return "remote-backend";
  case Origin::ExternalCalendar:
    return "external-calendar";
  }
  return "local";
}

std::optional<Origin> originFromString(const std::string &value) {
  if (value == "local")
    return Origin::Local;
  if (value == "remote-backend")
    return Origin::RemoteBackend;
  if (value == "external-calendar")
    return Origin::ExternalCalendar;
  return std::nullopt;
}

std::string toString(ChangeOp op) {
  switch (op) {
  case ChangeOp::Create:
    return "create";
  case ChangeOp::Update:
    return "update";
  case ChangeOp::Delete:
    return "delete";
  }
  return "update";
}

std::optional<ChangeOp> changeOpFromString(const std::string &value) {
  if (value == "create")
    return ChangeOp::Create;
  if (value == "update")
    return ChangeOp::Update;
  if (value == "delete")
    return ChangeOp::Delete;
  return std::nullopt;
}

std::string toString(ConflictPolicy policy) {
  switch (policy) {
  case ConflictPolicy::NewerWins:
    return "newer-wins";
  case ConflictPolicy::LocalWins:
    return "local-wins";
  case ConflictPolicy::RemoteWins:
    return "remote-wins";
  }
  return "newer-wins";
}

std::optional<ConflictPolicy> conflictPolicyFromString(const std::string &value) {
  if (value == "newer-wins")
    return ConflictPolicy::NewerWins;
  if (value == "local-wins")
    return ConflictPolicy::LocalWins;
  if (value == "remote-wins")
    return ConflictPolicy::RemoteWins;
  return std::nullopt;
}

std::string toString(SyncState state) {
  switch (state) {
  case SyncState::Idle:
    return "Idle";
  case SyncState::Pulling:
    return "Pulling";
  case SyncState::Reconciling:
    return "Reconciling";
  case SyncState::Pushing:
    return "Pushing";
  case SyncState::Failed:
    return "Failed";
  }
  return "Idle";
}

std::string toString(AuthorizationState state) {
  switch (state) {
  case AuthorizationState::NotRequested:
    return "not-requested";
  case AuthorizationState::Denied:
    return "denied";
  case AuthorizationState::ReadWrite:
    return "read-write";
  case AuthorizationState::WriteOnly:
    return "write-only";
  }
  return "not-requested";
}

std::optional<AuthorizationState>
authorizationStateFromString(const std::string &value) {
  if (value == "not-requested")
    return AuthorizationState::NotRequested;
  if (value == "denied")
    return AuthorizationState::Denied;
  if (value == "read-write")
    return AuthorizationState::ReadWrite;
  if (value == "write-only")
    return AuthorizationState::WriteOnly;
  return std::nullopt;
}

std::string toString(RecordType type) {
  return type == RecordType::Exception ? "exception" : "series";
}

std::optional<RecordType> recordTypeFromString(const std::string &value) {
  if (value == "series")
    return RecordType::Series;
  if (value == "exception")
    return RecordType::Exception;
  return std::nullopt;
}

} // namespace calsync
