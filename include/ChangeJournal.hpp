#pragma once
#include "DatabaseManager.hpp"
#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace calsync {

struct JournalSettings {
  int32_t maxRetries = 5;
  int64_t backoffBaseSeconds = 30;
  int64_t backoffMaxSeconds = 3600;
};

/**
 * Outbox of local mutations not yet confirmed by a sync target.
 *
 * Entries live in the Journal table, so an append made inside a
 * DatabaseManager::transaction() commits or rolls back together with the
 * mutation it records. Each entry is addressed to exactly one target.
 */
class ChangeJournal {
public:
  explicit ChangeJournal(DatabaseManager &db, JournalSettings settings = {});

  // Appends one entry per target. Returns false (and writes nothing when
  // called outside a transaction) if any insert fails.
  bool append(ChangeOp op, const SyncableRecord &snapshot,
              const std::vector<Origin> &targets, Instant now);
  std::optional<int64_t> append(const PendingChange &change);

  // Oldest-first entries for `target` that are due at `now`. An entry still
  // waiting on its backoff, or one that exhausted its retries, holds back
  // every younger entry for the same record.
  std::vector<PendingChange> pendingBatch(Origin target, size_t maxSize,
                                          Instant now);

  bool ack(const std::vector<int64_t> &changeIds);
  bool requeue(const std::vector<int64_t> &changeIds, Instant now,
               const std::string &reason = std::string());

  // Removes every entry for (recordId, target), e.g. after a conflict
  // resolution superseded them.
  bool supersede(const std::string &recordId, Origin target);

  std::vector<PendingChange> failures(Origin target);
  bool retryFailed(Origin target, Instant now);

  size_t pendingCount(Origin target);
  bool hasPending(const std::string &recordId, Origin target);

  int64_t backoffFor(int32_t retryCount) const;

private:
  DatabaseManager &m_db;
  JournalSettings m_settings;
};

} // namespace calsync
