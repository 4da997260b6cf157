#include "ChangeJournal.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace calsync {

ChangeJournal::ChangeJournal(DatabaseManager &db, JournalSettings settings)
    : m_db(db), m_settings(settings) {}

bool ChangeJournal::append(ChangeOp op, const SyncableRecord &snapshot,
                           const std::vector<Origin> &targets, Instant now) {
  return m_db.transaction([&] {
    for (Origin target : targets) {
      PendingChange change;
      change.target = target;
      change.op = op;
      change.recordId = snapshot.id;
      change.snapshot = snapshot;
      change.createdAt = now;
      change.nextAttemptAt = now;
      if (!append(change))
        return false;
    }
    return true;
  });
}

std::optional<int64_t> ChangeJournal::append(const PendingChange &change) {
  auto id = m_db.insertJournal(change);
  if (!id) {
    std::cerr << "[Journal] Failed to record " << toString(change.op)
              << " of " << change.recordId << " for "
              << toString(change.target) << std::endl;
  }
  return id;
}

std::vector<PendingChange> ChangeJournal::pendingBatch(Origin target,
                                                       size_t maxSize,
                                                       Instant now) {
  std::vector<PendingChange> batch;
  std::set<std::string> heldBack;

  for (auto &entry : m_db.getJournal(target)) {
    if (batch.size() >= maxSize)
      break;
    if (heldBack.count(entry.recordId))
      continue;
    if (entry.failed || entry.nextAttemptAt > now) {
      heldBack.insert(entry.recordId);
      continue;
    }
    batch.push_back(std::move(entry));
  }
  return batch;
}

bool ChangeJournal::ack(const std::vector<int64_t> &changeIds) {
  return m_db.transaction([&] {
    for (int64_t id : changeIds) {
      if (!m_db.deleteJournal(id))
        return false;
    }
    return true;
  });
}

int64_t ChangeJournal::backoffFor(int32_t retryCount) const {
  int64_t delay = m_settings.backoffBaseSeconds;
  for (int32_t i = 1; i < retryCount && delay < m_settings.backoffMaxSeconds;
       ++i)
    delay *= 2;
  return std::min(delay, m_settings.backoffMaxSeconds);
}

bool ChangeJournal::requeue(const std::vector<int64_t> &changeIds, Instant now,
                            const std::string &reason) {
  return m_db.transaction([&] {
    for (int64_t id : changeIds) {
      auto entry = m_db.getJournalEntry(id);
      if (!entry)
        continue; // acked in the meantime
      entry->retryCount += 1;
      entry->nextAttemptAt = now + backoffFor(entry->retryCount);
      entry->lastError = reason;
      if (entry->retryCount > m_settings.maxRetries) {
        entry->failed = true;
        std::cerr << "[Journal] Giving up on " << toString(entry->op) << " of "
                  << entry->recordId << " for " << toString(entry->target)
                  << " after " << entry->retryCount - 1
                  << " retries: " << reason << std::endl;
      }
      if (!m_db.updateJournal(*entry))
        return false;
    }
    return true;
  });
}

bool ChangeJournal::supersede(const std::string &recordId, Origin target) {
  return m_db.transaction([&] {
    for (const auto &entry : m_db.getJournal(target)) {
      if (entry.recordId == recordId && !m_db.deleteJournal(entry.changeId))
        return false;
    }
    return true;
  });
}

std::vector<PendingChange> ChangeJournal::failures(Origin target) {
  std::vector<PendingChange> out;
  for (auto &entry : m_db.getJournal(target)) {
    if (entry.failed)
      out.push_back(std::move(entry));
  }
  return out;
}

bool ChangeJournal::retryFailed(Origin target, Instant now) {
  return m_db.transaction([&] {
    for (auto entry : failures(target)) {
      entry.failed = false;
      entry.retryCount = 0;
      entry.nextAttemptAt = now;
      if (!m_db.updateJournal(entry))
        return false;
    }
    return true;
  });
}

size_t ChangeJournal::pendingCount(Origin target) {
  return m_db.getJournal(target).size();
}

bool ChangeJournal::hasPending(const std::string &recordId, Origin target) {
  return m_db.hasPendingJournal(recordId, target);
}

} // namespace calsync
