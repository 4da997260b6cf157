#pragma once
#include "types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace calsync {

/**
 * Local persistent store on SQLite (through sqlite_orm).
 *
 * Readers propagate the std::system_error sqlite_orm throws; writers log and
 * return false. Every call is serialized on one connection, and transaction()
 * holds that lock for its whole body so a batch is never observed half done.
 */
class DatabaseManager {
public:
  explicit DatabaseManager(const std::string &dbPath);
  ~DatabaseManager();

  // Connection management
  bool open();
  void close();
  void initializeSchema();

  // Commits when `work` returns true; rolls back when it returns false or
  // throws. Nested calls join the outer transaction.
  bool transaction(const std::function<bool()> &work);

  // Records
  std::optional<SyncableRecord> getRecord(const std::string &id);
  std::vector<SyncableRecord> getAllRecords(bool includeDeleted = false);
  std::vector<SyncableRecord> getRecordsByType(RecordType type,
                                               bool includeDeleted = false);
  bool upsertRecord(const SyncableRecord &record);
  bool purgeRecord(const std::string &id);
  // Soft-deleted records remember which origins confirmed the deletion.
  bool confirmDeletion(const std::string &id, Origin origin);
  std::vector<std::string>
  getConfirmedDeletions(const std::vector<Origin> &requiredOrigins);

  // Shadows: last copy seen from (or acknowledged by) each origin
  std::optional<SyncableRecord> getShadow(const std::string &id, Origin origin);
  bool upsertShadow(const SyncableRecord &record, Origin origin);

  // Journal operations
  std::optional<int64_t> insertJournal(const PendingChange &change);
  std::vector<PendingChange> getJournal(Origin target);
  std::optional<PendingChange> getJournalEntry(int64_t changeId);
  bool updateJournal(const PendingChange &change);
  bool deleteJournal(int64_t changeId);
  bool hasPendingJournal(const std::string &recordId, Origin target);

  // Sync cursors
  std::string getCursor(Origin target);
  bool setCursor(Origin target, const std::string &cursor);

  // Materialized occurrences
  std::vector<Occurrence> getOccurrences(Instant from, Instant to);
  bool replaceOccurrencesFrom(Instant from,
                              const std::vector<Occurrence> &occurrences);

  // Scheduled notifications
  std::vector<ScheduledNotification> getNotifications();
  bool upsertNotification(const ScheduledNotification &notification);
  bool deleteNotification(const std::string &occurrenceId,
                          int64_t offsetSeconds);

private:
  std::string m_dbPath;
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace calsync
