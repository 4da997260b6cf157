#pragma once
#include "ChangeJournal.hpp"
#include "DatabaseManager.hpp"
#include "NotificationScheduler.hpp"
#include "SyncCoordinator.hpp"
#include "types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace calsync {

struct SeriesDraft {
  ItemKind kind = ItemKind::Event;
  std::string title;
  std::string notes;
  std::string category;
  bool recurring = true;
  RecurrenceRule rule;
  Instant start = 0;
  int64_t durationSeconds = 0;
};

struct SeriesEdit {
  std::optional<std::string> title;
  std::optional<std::string> notes;
  std::optional<std::string> category;
};

struct OccurrenceEdit {
  Instant start = 0;
  Instant end = 0;
  std::optional<std::string> title;
};

struct CommandResult {
  bool ok = false;
  std::string id;
  std::string error;
};

struct EngineSettings {
  int32_t horizonDays = 60;
  ConflictPolicy policy = ConflictPolicy::NewerWins;
};

/**
 * Entry point for user commands and the owner of derived state.
 *
 * Every command writes the changed record and one journal entry per target
 * that carries it in a single transaction; if the journal write fails the
 * command fails and nothing is stored. After each command, and after each
 * sync cycle that changed records, occurrences are materialized for
 * [now - 1 day, now + horizonDays) and notifications are refreshed.
 */
class CalendarEngine {
public:
  CalendarEngine(DatabaseManager &db, ChangeJournal &journal,
                 NotificationScheduler &notifications,
                 EngineSettings settings = {}, Clock clock = systemNow);

  // Wires a coordinator to this engine and to the coordinators attached
  // before it. Call before starting any of them.
  void attach(SyncCoordinator &coordinator);
  std::vector<Origin> targets() const;

  CommandResult createSeries(const SeriesDraft &draft);
  CommandResult editSeries(const std::string &seriesId, const SeriesEdit &edit);
  // Future occurrences follow `rule` from `anchor`; earlier ones keep the
  // previous rule.
  CommandResult replaceRule(const std::string &seriesId,
                            const RecurrenceRule &rule, Instant anchor,
                            int64_t durationSeconds);
  CommandResult deleteSeries(const std::string &seriesId);

  CommandResult editOccurrence(const std::string &occurrenceId,
                               const OccurrenceEdit &edit);
  CommandResult cancelOccurrence(const std::string &occurrenceId);
  CommandResult resetOccurrence(const std::string &occurrenceId);
  CommandResult toggleCompletion(const std::string &occurrenceId);

  void setConflictPolicy(ConflictPolicy policy);
  ConflictPolicy conflictPolicy() const;
  void syncNow();
  void reauthorize(Origin target);
  bool retryFailures();
  size_t purgeConfirmedDeletions();

  std::vector<Occurrence> occurrences(Instant from, Instant to);
  std::optional<SyncStatus> status(Origin target) const;
  std::vector<PendingChange> syncFailures();
  size_t pendingNotificationCount();
  bool remindersDegraded() const;

  bool refresh();
  bool routes(const SyncableRecord &record, Origin target);

private:
  DatabaseManager &m_db;
  ChangeJournal &m_journal;
  NotificationScheduler &m_notifications;
  EngineSettings m_settings;
  Clock m_clock;
  std::vector<SyncCoordinator *> m_coordinators;
  mutable std::mutex m_mutex;

  bool refreshLocked();
  std::vector<Occurrence> occurrencesLocked(Instant from, Instant to);
  std::map<std::string, std::vector<OccurrenceException>> loadExceptions();
  bool commit(const SyncableRecord &record, ChangeOp op);
  std::vector<Origin> targetsFor(const SyncableRecord &record);

  std::optional<SeriesPayload> liveSeries(const std::string &seriesId,
                                          SyncableRecord &record,
                                          std::string &error);
  std::optional<Occurrence> generatedOccurrence(const std::string &seriesId,
                                                const SeriesPayload &series,
                                                const CivilDate &date);
  CommandResult writeException(const std::string &occurrenceId,
                               ExceptionKind kind,
                               const std::optional<OccurrenceEdit> &edit,
                               bool toggleCompleted);
};

} // namespace calsync
