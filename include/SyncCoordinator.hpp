#pragma once
#include "ChangeJournal.hpp"
#include "ConflictResolver.hpp"
#include "DatabaseManager.hpp"
#include "SyncTarget.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace calsync {

struct SyncSettings {
  int64_t intervalSeconds = 300;
  size_t batchSize = 50;
  // Attempts per network call before the cycle fails.
  int32_t networkAttempts = 3;
  int64_t retryBaseMillis = 500;
  int64_t retryMaxMillis = 8000;
  // Pause between a failed cycle and the return to Idle.
  int64_t failureBackoffBaseSeconds = 30;
  int64_t failureBackoffMaxSeconds = 900;
};

/**
 * Keeps one SyncTarget in step with the local store.
 *
 * A cycle pulls everything since the stored cursor, reconciles it into the
 * store, then drains the target's journal entries. Each pulled batch commits
 * together with its cursor, so a failed or cancelled cycle re-pulls the same
 * changes next time. Pulled changes are relayed to the peer targets through
 * the journal.
 *
 * start() runs cycles on a worker thread, on a timer and on requestSync().
 * runCycle() runs one cycle on the calling thread. Peers, router and
 * callback must be set before start().
 */
class SyncCoordinator {
public:
  // Decides whether a record travels to a given target.
  using Router = std::function<bool(const SyncableRecord &, Origin)>;
  // Called after a cycle with the records it changed locally.
  using AppliedCallback =
      std::function<void(const std::vector<SyncableRecord> &)>;

  SyncCoordinator(DatabaseManager &db, ChangeJournal &journal,
                  SyncTarget &target, SyncSettings settings = {},
                  Clock clock = systemNow);
  ~SyncCoordinator();

  SyncCoordinator(const SyncCoordinator &) = delete;
  SyncCoordinator &operator=(const SyncCoordinator &) = delete;

  Origin origin() const { return m_target.origin(); }

  void setPeers(std::vector<Origin> peers) { m_peers = std::move(peers); }
  void setRouter(Router router) { m_router = std::move(router); }
  void setOnApplied(AppliedCallback callback) {
    m_onApplied = std::move(callback);
  }
  void setPolicy(ConflictPolicy policy) { m_policy = policy; }
  ConflictPolicy policy() const { return m_policy; }

  void start();
  void stop();

  // Coalesced: any number of requests during a cycle yield one more cycle.
  void requestSync();
  // Clears a suspension caused by denied authorization.
  void reauthorize();

  bool runCycle();
  SyncStatus status() const;

private:
  struct BatchCounters {
    int32_t downloaded = 0;
    int32_t deleted = 0;
    int32_t conflicts = 0;
    int32_t malformed = 0;
    std::vector<SyncableRecord> applied;
  };

  DatabaseManager &m_db;
  ChangeJournal &m_journal;
  SyncTarget &m_target;
  SyncSettings m_settings;
  Clock m_clock;
  ConflictResolver m_resolver;
  std::vector<Origin> m_peers;
  Router m_router;
  AppliedCallback m_onApplied;
  std::atomic<ConflictPolicy> m_policy{ConflictPolicy::NewerWins};

  mutable std::mutex m_statusMutex;
  SyncStatus m_status;

  std::mutex m_cycleMutex;
  mutable std::mutex m_wakeMutex;
  std::condition_variable m_wake;
  bool m_pending = false;
  std::atomic<bool> m_stopping{false};
  std::thread m_worker;

  void workerLoop();
  bool pullPhase(std::vector<SyncableRecord> &applied);
  bool pushPhase(std::vector<SyncableRecord> &applied);
  bool reconcileIncoming(SyncableRecord incoming, bool force,
                         BatchCounters &counters);
  bool acknowledge(const PendingChange &change);
  bool relay(const SyncableRecord &record, ChangeOp op,
             const std::vector<Origin> &skip = {});
  bool routes(const SyncableRecord &record, Origin target) const;

  template <typename Call>
  auto withRetry(Call call, const char *what) -> decltype(call());
  bool waitFor(std::chrono::milliseconds delay);
  std::chrono::seconds failureBackoff() const;

  void setState(SyncState state);
  void fail(const SyncError &error);
  void merge(const BatchCounters &counters);
  std::string tag() const;
};

} // namespace calsync
