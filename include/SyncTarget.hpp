#pragma once
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace calsync {

struct PullResult {
  std::optional<SyncError> error;
  std::vector<SyncableRecord> changes;
  std::string newCursor;
  bool hasMore = false;
};

enum class PushOutcome { Ack, Conflict, Error };

struct PushResult {
  int64_t changeId = 0;
  PushOutcome outcome = PushOutcome::Error;
  // The target's current copy when outcome == Conflict.
  std::optional<SyncableRecord> current;
  std::string message;
};

struct PushResponse {
  // Set when the batch as a whole failed; `results` is then empty.
  std::optional<SyncError> error;
  std::vector<PushResult> results;
};

/**
 * A remote store the coordinator keeps in step with the local one. Both the
 * remote sync backend and the external calendar implement this.
 *
 * Implementations must be safe to cancel() from another thread while a pull
 * or push is in flight; the interrupted call reports SyncErrorKind::Cancelled.
 */
class SyncTarget {
public:
  virtual ~SyncTarget() = default;

  virtual Origin origin() const = 0;
  virtual std::string name() const = 0;

  virtual AuthorizationState authorize() = 0;
  virtual PullResult pull(const std::string &cursor) = 0;
  virtual PushResponse push(const std::vector<PendingChange> &batch) = 0;

  virtual void cancel() = 0;
  virtual void resume() = 0;
};

} // namespace calsync
