#include "SyncCoordinator.hpp"
#include "RecurrenceRules.hpp"
#include "Serialization.hpp"
#include <algorithm>
#include <iostream>
#include <map>

namespace calsync {

namespace {

bool sameContent(const SyncableRecord &a, const SyncableRecord &b) {
  if (a.deleted != b.deleted)
    return false;
  return a.deleted || a.payload == b.payload;
}

constexpr int32_t kMaxConflictRounds = 3;

ChangeOp opFor(const SyncableRecord &record) {
  return record.deleted ? ChangeOp::Delete : ChangeOp::Update;
}

// Why an incoming record cannot be stored, if it cannot. Series rules get the
// same validation as locally created ones.
std::optional<std::string> malformedReason(const SyncableRecord &record) {
  if (record.deleted)
    return std::nullopt;
  if (record.type == RecordType::Exception) {
    if (!decodeException(record.payload))
      return std::string("unreadable exception payload");
    return std::nullopt;
  }
  auto series = decodeSeries(record.payload);
  if (!series)
    return std::string("unreadable series payload");
  if (auto error = validateSeries(*series))
    return error->message;
  return std::nullopt;
}

} // namespace

SyncCoordinator::SyncCoordinator(DatabaseManager &db, ChangeJournal &journal,
                                 SyncTarget &target, SyncSettings settings,
                                 Clock clock)
    : m_db(db), m_journal(journal), m_target(target), m_settings(settings),
      m_clock(std::move(clock)) {}

SyncCoordinator::~SyncCoordinator() { stop(); }

std::string SyncCoordinator::tag() const {
  return "[Sync:" + m_target.name() + "]";
}

void SyncCoordinator::start() {
  if (m_worker.joinable())
    return;
  m_stopping = false;
  m_target.resume();
  {
    std::lock_guard<std::mutex> lock(m_wakeMutex);
    m_pending = true; // first cycle right away
  }
  m_worker = std::thread(&SyncCoordinator::workerLoop, this);
  std::cout << tag() << " Worker started, interval "
            << m_settings.intervalSeconds << "s" << std::endl;
}

void SyncCoordinator::stop() {
  if (!m_worker.joinable())
    return;
  m_stopping = true;
  m_target.cancel();
  {
    std::lock_guard<std::mutex> lock(m_wakeMutex);
  }
  m_wake.notify_all();
  m_worker.join();
  std::cout << tag() << " Worker stopped" << std::endl;
}

void SyncCoordinator::requestSync() {
  {
    std::lock_guard<std::mutex> lock(m_wakeMutex);
    m_pending = true;
  }
  m_wake.notify_all();
}

void SyncCoordinator::reauthorize() {
  {
    std::lock_guard<std::mutex> lock(m_statusMutex);
    m_status.suspended = false;
    if (m_status.state == SyncState::Failed)
      m_status.state = SyncState::Idle;
  }
  m_target.resume();
  std::cout << tag() << " Reauthorization requested" << std::endl;
  requestSync();
}

SyncStatus SyncCoordinator::status() const {
  SyncStatus copy;
  {
    std::lock_guard<std::mutex> lock(m_statusMutex);
    copy = m_status;
  }
  std::lock_guard<std::mutex> lock(m_wakeMutex);
  copy.pendingRequest = m_pending;
  return copy;
}

void SyncCoordinator::setState(SyncState state) {
  std::lock_guard<std::mutex> lock(m_statusMutex);
  m_status.state = state;
}

void SyncCoordinator::fail(const SyncError &error) {
  std::lock_guard<std::mutex> lock(m_statusMutex);
  m_status.state = SyncState::Failed;
  m_status.failureReason = error.message;
  m_status.consecutiveFailures += 1;
  m_status.stats.errors += 1;
  if (error.kind == SyncErrorKind::AuthorizationDenied)
    m_status.suspended = true;
  std::cerr << tag() << " Cycle failed: " << error.message
            << (m_status.suspended ? " (suspended until reauthorized)" : "")
            << std::endl;
}

void SyncCoordinator::merge(const BatchCounters &counters) {
  std::lock_guard<std::mutex> lock(m_statusMutex);
  m_status.stats.recordsDownloaded += counters.downloaded;
  m_status.stats.recordsDeleted += counters.deleted;
  m_status.stats.conflictsResolved += counters.conflicts;
  m_status.stats.errors += counters.malformed;
}

std::chrono::seconds SyncCoordinator::failureBackoff() const {
  int32_t failures;
  {
    std::lock_guard<std::mutex> lock(m_statusMutex);
    failures = m_status.consecutiveFailures;
  }
  int64_t delay = m_settings.failureBackoffBaseSeconds;
  for (int32_t i = 1;
       i < failures && delay < m_settings.failureBackoffMaxSeconds; ++i)
    delay *= 2;
  return std::chrono::seconds(
      std::min(delay, m_settings.failureBackoffMaxSeconds));
}

bool SyncCoordinator::waitFor(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(m_wakeMutex);
  m_wake.wait_for(lock, delay, [this] { return m_stopping.load(); });
  return !m_stopping;
}

template <typename Call>
auto SyncCoordinator::withRetry(Call call, const char *what)
    -> decltype(call()) {
  std::chrono::milliseconds delay(m_settings.retryBaseMillis);
  const std::chrono::milliseconds cap(m_settings.retryMaxMillis);
  for (int32_t attempt = 1;; ++attempt) {
    auto result = call();
    if (!result.error || result.error->kind != SyncErrorKind::Transient ||
        attempt >= m_settings.networkAttempts)
      return result;
    std::cerr << tag() << " " << what << " attempt " << attempt
              << " failed: " << result.error->message << ", retrying in "
              << delay.count() << "ms" << std::endl;
    if (!waitFor(delay)) {
      result.error = SyncError{SyncErrorKind::Cancelled,
                               std::string(what) + " cancelled"};
      return result;
    }
    delay = std::min(delay * 2, cap);
  }
}

void SyncCoordinator::workerLoop() {
  while (!m_stopping) {
    {
      std::unique_lock<std::mutex> lock(m_wakeMutex);
      m_wake.wait_for(lock, std::chrono::seconds(m_settings.intervalSeconds),
                      [this] { return m_stopping.load() || m_pending; });
      if (m_stopping)
        break;
      m_pending = false;
    }

    if (runCycle())
      continue;

    // Failed: hold off, then fall back to Idle.
    if (!waitFor(failureBackoff()))
      break;
    std::lock_guard<std::mutex> lock(m_statusMutex);
    if (m_status.state == SyncState::Failed)
      m_status.state = SyncState::Idle;
  }
}

bool SyncCoordinator::runCycle() {
  std::lock_guard<std::mutex> cycle(m_cycleMutex);
  {
    std::lock_guard<std::mutex> lock(m_statusMutex);
    if (m_status.suspended)
      return false;
  }

  std::vector<SyncableRecord> applied;
  bool ok = false;
  try {
    AuthorizationState auth = m_target.authorize();
    if (auth == AuthorizationState::Denied) {
      fail({SyncErrorKind::AuthorizationDenied,
            m_target.name() + " access denied"});
      return false;
    }
    if (auth == AuthorizationState::NotRequested) {
      fail({SyncErrorKind::Transient,
            m_target.name() + " access not granted yet"});
      return false;
    }

    ok = true;
    if (auth == AuthorizationState::ReadWrite)
      ok = pullPhase(applied);
    else
      std::cout << tag() << " Write-only access, skipping pull" << std::endl;
    if (ok)
      ok = pushPhase(applied);
  } catch (const std::exception &e) {
    fail({SyncErrorKind::Storage, e.what()});
    ok = false;
  }

  if (!applied.empty() && m_onApplied)
    m_onApplied(applied);
  if (!ok)
    return false;

  std::lock_guard<std::mutex> lock(m_statusMutex);
  m_status.state = SyncState::Idle;
  m_status.failureReason.clear();
  m_status.consecutiveFailures = 0;
  m_status.stats.lastSyncAt = m_clock();
  std::cout << tag() << " Cycle complete (" << m_status.stats.recordsDownloaded
            << " down, " << m_status.stats.recordsUploaded << " up so far)"
            << std::endl;
  return true;
}

bool SyncCoordinator::pullPhase(std::vector<SyncableRecord> &applied) {
  std::string cursor = m_db.getCursor(origin());
  bool more = true;
  while (more) {
    setState(SyncState::Pulling);
    PullResult result =
        withRetry([&] { return m_target.pull(cursor); }, "pull");
    if (result.error) {
      fail(*result.error);
      return false;
    }
    if (m_stopping) {
      fail({SyncErrorKind::Cancelled, "pull cancelled"});
      return false;
    }

    setState(SyncState::Reconciling);
    BatchCounters counters;
    bool committed = m_db.transaction([&] {
      for (const auto &record : result.changes) {
        if (!reconcileIncoming(record, false, counters))
          return false;
      }
      return m_db.setCursor(origin(), result.newCursor);
    });
    if (!committed) {
      fail({SyncErrorKind::Storage, "could not apply pulled batch"});
      return false;
    }

    merge(counters);
    applied.insert(applied.end(), counters.applied.begin(),
                   counters.applied.end());
    cursor = result.newCursor;
    more = result.hasMore;
  }
  return true;
}

bool SyncCoordinator::pushPhase(std::vector<SyncableRecord> &applied) {
  setState(SyncState::Pushing);
  std::map<std::string, int32_t> conflictRounds;
  while (!m_stopping) {
    Instant now = m_clock();
    auto batch = m_journal.pendingBatch(origin(), m_settings.batchSize, now);
    if (batch.empty())
      return true;

    PushResponse response =
        withRetry([&] { return m_target.push(batch); }, "push");
    if (response.error) {
      if (response.error->kind != SyncErrorKind::Cancelled) {
        std::vector<int64_t> ids;
        for (const auto &change : batch)
          ids.push_back(change.changeId);
        if (!m_journal.requeue(ids, now, response.error->message))
          std::cerr << tag() << " Could not requeue failed batch" << std::endl;
      }
      fail(*response.error);
      return false;
    }

    std::map<int64_t, const PushResult *> results;
    for (const auto &result : response.results)
      results[result.changeId] = &result;

    std::vector<int64_t> retry;
    std::string lastError;
    bool progressed = false;
    for (const auto &change : batch) {
      auto it = results.find(change.changeId);
      if (it == results.end() || it->second->outcome == PushOutcome::Error) {
        lastError = it == results.end() ? "no result for change"
                                        : it->second->message;
        retry.push_back(change.changeId);
        continue;
      }

      if (it->second->outcome == PushOutcome::Ack) {
        if (!acknowledge(change)) {
          fail({SyncErrorKind::Storage, "could not acknowledge change"});
          return false;
        }
        std::lock_guard<std::mutex> lock(m_statusMutex);
        m_status.stats.recordsUploaded += 1;
        progressed = true;
        continue;
      }

      // Conflict: fold the target's copy in like a pulled change, then the
      // entry is settled either way. A record that keeps conflicting backs
      // off like a rejected one.
      const SyncableRecord current =
          it->second->current ? *it->second->current : change.snapshot;
      if (++conflictRounds[change.recordId] > kMaxConflictRounds) {
        lastError = "conflict on " + change.recordId + " did not settle";
        retry.push_back(change.changeId);
        continue;
      }
      if (auto reason = malformedReason(current)) {
        lastError = "unusable conflicting copy: " + *reason;
        retry.push_back(change.changeId);
        continue;
      }
      BatchCounters counters;
      bool committed = m_db.transaction([&] {
        return reconcileIncoming(current, true, counters) &&
               m_journal.ack({change.changeId});
      });
      if (!committed) {
        fail({SyncErrorKind::Storage, "could not apply push conflict"});
        return false;
      }
      merge(counters);
      applied.insert(applied.end(), counters.applied.begin(),
                     counters.applied.end());
      progressed = true;
    }

    if (!retry.empty()) {
      std::cerr << tag() << " " << retry.size()
                << " change(s) rejected, requeued: " << lastError << std::endl;
      if (!m_journal.requeue(retry, now, lastError)) {
        fail({SyncErrorKind::Storage, "could not requeue rejected changes"});
        return false;
      }
      std::lock_guard<std::mutex> lock(m_statusMutex);
      m_status.stats.errors += static_cast<int32_t>(retry.size());
    }
    if (!progressed)
      return true; // everything left is backing off
  }
  fail({SyncErrorKind::Cancelled, "push cancelled"});
  return false;
}

bool SyncCoordinator::acknowledge(const PendingChange &change) {
  return m_db.transaction([&] {
    if (!m_journal.ack({change.changeId}))
      return false;
    auto shadow = m_db.getShadow(change.recordId, origin());
    if (!shadow || shadow->version < change.snapshot.version) {
      if (!m_db.upsertShadow(change.snapshot, origin()))
        return false;
    }
    if (change.snapshot.deleted)
      return m_db.confirmDeletion(change.recordId, origin());
    return true;
  });
}

bool SyncCoordinator::routes(const SyncableRecord &record,
                             Origin target) const {
  return !m_router || m_router(record, target);
}

bool SyncCoordinator::relay(const SyncableRecord &record, ChangeOp op,
                            const std::vector<Origin> &skip) {
  for (Origin peer : m_peers) {
    if (std::find(skip.begin(), skip.end(), peer) != skip.end())
      continue;
    if (!routes(record, peer))
      continue;
    if (!m_journal.append(op, record, {peer}, m_clock()))
      return false;
  }
  return true;
}

bool SyncCoordinator::reconcileIncoming(SyncableRecord incoming, bool force,
                                        BatchCounters &counters) {
  const Origin self = origin();
  incoming.origin = self;

  if (auto reason = malformedReason(incoming)) {
    std::cerr << tag() << " Dropping malformed " << incoming.id << ": "
              << *reason << std::endl;
    counters.malformed += 1;
    return true;
  }

  auto shadow = m_db.getShadow(incoming.id, self);
  bool seen = shadow && incoming.version <= shadow->version;
  if (seen && !force)
    return true;
  if (!seen && !m_db.upsertShadow(incoming, self))
    return false;

  auto local = m_db.getRecord(incoming.id);
  if (!local) {
    if (incoming.deleted)
      return true;
    if (!m_db.upsertRecord(incoming) || !relay(incoming, ChangeOp::Create))
      return false;
    counters.downloaded += 1;
    counters.applied.push_back(incoming);
    return true;
  }

  bool dirty = m_journal.hasPending(incoming.id, self);
  if (!dirty && incoming.version <= local->version)
    return true; // stale, the local copy is already ahead
  if (!dirty) {
    if (!m_db.upsertRecord(incoming) || !relay(incoming, opFor(incoming)))
      return false;
    if (incoming.deleted) {
      if (!m_db.confirmDeletion(incoming.id, self))
        return false;
      counters.deleted += 1;
    }
    counters.downloaded += 1;
    counters.applied.push_back(incoming);
    return true;
  }

  std::optional<SyncableRecord> remote;
  std::optional<SyncableRecord> external;
  (self == Origin::ExternalCalendar ? external : remote) = incoming;
  for (Origin peer : m_peers) {
    auto peerCopy = m_db.getShadow(incoming.id, peer);
    if (peerCopy && peerCopy->version > local->version)
      (peer == Origin::ExternalCalendar ? external : remote) = peerCopy;
  }

  Resolution resolution =
      m_resolver.resolve(*local, remote, external, m_policy.load());
  const SyncableRecord &winner = resolution.winner;
  std::cout << tag() << " Conflict on " << incoming.id << " resolved for "
            << toString(resolution.winningOrigin) << " (" << resolution.reason
            << ")" << std::endl;

  if (!m_db.upsertRecord(winner) || !m_journal.supersede(incoming.id, self))
    return false;

  std::vector<Origin> pushed;
  for (const auto &target : resolution.repush) {
    if (!routes(winner, target.origin))
      continue;
    if (!m_journal.append(opFor(winner), winner, {target.origin}, m_clock()))
      return false;
    pushed.push_back(target.origin);
  }

  bool localChanged = !sameContent(*local, winner);
  if (localChanged) {
    pushed.push_back(self);
    if (!relay(winner, opFor(winner), pushed))
      return false;
    counters.applied.push_back(winner);
  }
  if (winner.deleted && incoming.deleted) {
    if (!m_db.confirmDeletion(incoming.id, self))
      return false;
  }
  counters.conflicts += 1;
  return true;
}

} // namespace calsync
