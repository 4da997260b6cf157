#include "DatabaseManager.hpp"
#include "CivilTime.hpp"
#include "Serialization.hpp"
#include <ctime>
#include <iostream>
#include <mutex>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>

using namespace sqlite_orm;

namespace calsync {

namespace {

// Persisted shapes. Enums are stored as their wire names so the database
// stays readable with the sqlite3 shell.
struct RecordRow {
  std::string id;
  std::string type;
  std::string origin;
  int64_t version = 0;
  int64_t lastModified = 0;
  bool deleted = false;
  std::string payload;
  int32_t deleteConfirmations = 0;
};

struct ShadowRow {
  std::string recordId;
  std::string origin;
  std::string type;
  int64_t version = 0;
  int64_t lastModified = 0;
  bool deleted = false;
  std::string payload;
};

struct JournalRow {
  int64_t id = 0;
  std::string target;
  std::string op;
  std::string recordId;
  std::string snapshot;
  int64_t createdAt = 0;
  int32_t retryCount = 0;
  int64_t nextAttemptAt = 0;
  bool failed = false;
  std::string lastError;
};

struct CursorRow {
  std::string target;
  std::string cursor;
  int64_t updatedAt = 0;
};

struct OccurrenceRow {
  std::string id;
  std::string seriesId;
  int32_t sequence = 0;
  std::string originalDate;
  int64_t start = 0;
  int64_t end = 0;
  int32_t status = 0;
  int32_t kind = 0;
  std::string title;
  bool completed = false;
};

struct NotificationRow {
  std::string occurrenceId;
  int64_t offsetSeconds = 0;
  int64_t trigger = 0;
  std::string channel;
  std::string title;
};

int32_t originBit(Origin origin) { return 1 << static_cast<int>(origin); }

} // namespace

// Helper that lets decltype deduce the storage type.
inline auto create_storage_impl(const std::string &path) {
  return make_storage(
      path,
      make_table<RecordRow>(
          "Record", make_column("id", &RecordRow::id, primary_key()),
          make_column("type", &RecordRow::type),
          make_column("origin", &RecordRow::origin),
          make_column("version", &RecordRow::version),
          make_column("last_modified", &RecordRow::lastModified),
          make_column("deleted", &RecordRow::deleted),
          make_column("payload", &RecordRow::payload),
          make_column("delete_confirmations",
                      &RecordRow::deleteConfirmations)),
      make_table<ShadowRow>(
          "Shadow", make_column("record_id", &ShadowRow::recordId),
          make_column("origin", &ShadowRow::origin),
          make_column("type", &ShadowRow::type),
          make_column("version", &ShadowRow::version),
          make_column("last_modified", &ShadowRow::lastModified),
          make_column("deleted", &ShadowRow::deleted),
          make_column("payload", &ShadowRow::payload),
          primary_key(&ShadowRow::recordId, &ShadowRow::origin)),
      make_table<JournalRow>(
          "Journal",
          make_column("id", &JournalRow::id, primary_key().autoincrement()),
          make_column("target", &JournalRow::target),
          make_column("op", &JournalRow::op),
          make_column("record_id", &JournalRow::recordId),
          make_column("snapshot", &JournalRow::snapshot),
          make_column("created_at", &JournalRow::createdAt),
          make_column("retry_count", &JournalRow::retryCount),
          make_column("next_attempt_at", &JournalRow::nextAttemptAt),
          make_column("failed", &JournalRow::failed),
          make_column("last_error", &JournalRow::lastError)),
      make_table<CursorRow>(
          "Cursor", make_column("target", &CursorRow::target, primary_key()),
          make_column("cursor_value", &CursorRow::cursor),
          make_column("updated_at", &CursorRow::updatedAt)),
      make_table<OccurrenceRow>(
          "Occurrence", make_column("id", &OccurrenceRow::id, primary_key()),
          make_column("series_id", &OccurrenceRow::seriesId),
          make_column("sequence", &OccurrenceRow::sequence),
          make_column("original_date", &OccurrenceRow::originalDate),
          make_column("start_at", &OccurrenceRow::start),
          make_column("end_at", &OccurrenceRow::end),
          make_column("status", &OccurrenceRow::status),
          make_column("kind", &OccurrenceRow::kind),
          make_column("title", &OccurrenceRow::title),
          make_column("completed", &OccurrenceRow::completed)),
      make_table<NotificationRow>(
          "Notification",
          make_column("occurrence_id", &NotificationRow::occurrenceId),
          make_column("offset_seconds", &NotificationRow::offsetSeconds),
          make_column("trigger_at", &NotificationRow::trigger),
          make_column("channel", &NotificationRow::channel),
          make_column("title", &NotificationRow::title),
          primary_key(&NotificationRow::occurrenceId,
                      &NotificationRow::offsetSeconds)));
}

using Storage = decltype(create_storage_impl(""));

struct DatabaseManager::Impl {
  Storage storage;
  std::recursive_mutex mutex;
  int transactionDepth = 0;
  Impl(const std::string &path) : storage(create_storage_impl(path)) {}
};

namespace {

RecordRow toRow(const SyncableRecord &r) {
  RecordRow row;
  row.id = r.id;
  row.type = toString(r.type);
  row.origin = toString(r.origin);
  row.version = r.version;
  row.lastModified = r.lastModified;
  row.deleted = r.deleted;
  row.payload = r.payload;
  return row;
}

SyncableRecord fromRow(const RecordRow &row) {
  SyncableRecord r;
  r.id = row.id;
  r.type = recordTypeFromString(row.type).value_or(RecordType::Series);
  r.origin = originFromString(row.origin).value_or(Origin::Local);
  r.version = row.version;
  r.lastModified = row.lastModified;
  r.deleted = row.deleted;
  r.payload = row.payload;
  return r;
}

SyncableRecord fromShadow(const ShadowRow &row) {
  SyncableRecord r;
  r.id = row.recordId;
  r.type = recordTypeFromString(row.type).value_or(RecordType::Series);
  r.origin = originFromString(row.origin).value_or(Origin::RemoteBackend);
  r.version = row.version;
  r.lastModified = row.lastModified;
  r.deleted = row.deleted;
  r.payload = row.payload;
  return r;
}

JournalRow toRow(const PendingChange &c) {
  JournalRow row;
  row.id = c.changeId;
  row.target = toString(c.target);
  row.op = toString(c.op);
  row.recordId = c.recordId;
  row.snapshot = nlohmann::json(c.snapshot).dump();
  row.createdAt = c.createdAt;
  row.retryCount = c.retryCount;
  row.nextAttemptAt = c.nextAttemptAt;
  row.failed = c.failed;
  row.lastError = c.lastError;
  return row;
}

PendingChange fromRow(const JournalRow &row) {
  PendingChange c;
  c.changeId = row.id;
  c.target = originFromString(row.target).value_or(Origin::RemoteBackend);
  c.op = changeOpFromString(row.op).value_or(ChangeOp::Update);
  c.recordId = row.recordId;
  c.snapshot = nlohmann::json::parse(row.snapshot).get<SyncableRecord>();
  c.createdAt = row.createdAt;
  c.retryCount = row.retryCount;
  c.nextAttemptAt = row.nextAttemptAt;
  c.failed = row.failed;
  c.lastError = row.lastError;
  return c;
}

OccurrenceRow toRow(const Occurrence &o) {
  OccurrenceRow row;
  row.id = o.id;
  row.seriesId = o.seriesId;
  row.sequence = o.sequence;
  row.originalDate = civil::formatDate(o.originalDate);
  row.start = o.start;
  row.end = o.end;
  row.status = static_cast<int32_t>(o.status);
  row.kind = static_cast<int32_t>(o.kind);
  row.title = o.title;
  row.completed = o.completed;
  return row;
}

Occurrence fromRow(const OccurrenceRow &row) {
  Occurrence o;
  o.id = row.id;
  o.seriesId = row.seriesId;
  o.sequence = row.sequence;
  o.originalDate = civil::parseDate(row.originalDate).value_or(CivilDate{});
  o.start = row.start;
  o.end = row.end;
  o.status = static_cast<OccurrenceStatus>(row.status);
  o.kind = static_cast<ItemKind>(row.kind);
  o.title = row.title;
  o.completed = row.completed;
  return o;
}

} // namespace

DatabaseManager::DatabaseManager(const std::string &dbPath)
    : m_dbPath(dbPath), m_impl(std::make_unique<Impl>(dbPath)) {}

DatabaseManager::~DatabaseManager() = default;

bool DatabaseManager::open() {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  try {
    // One long-lived connection; also keeps ":memory:" databases alive.
    m_impl->storage.open_forever();
    m_impl->storage.busy_timeout(5000);
    std::cout << "[DB] Database connection opened: " << m_dbPath << std::endl;
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] Failed to open " << m_dbPath << ": " << e.what()
              << std::endl;
    return false;
  }
}

void DatabaseManager::close() {
  std::cout << "[DB] Closing " << m_dbPath << std::endl;
}

void DatabaseManager::initializeSchema() {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  std::cout << "[DB] Synchronizing schema via sqlite_orm..." << std::endl;
  m_impl->storage.sync_schema();
  std::cout << "[DB] Schema synchronized successfully." << std::endl;
}

bool DatabaseManager::transaction(const std::function<bool()> &work) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  if (m_impl->transactionDepth > 0)
    return work();

  struct DepthScope {
    int &depth;
    explicit DepthScope(int &d) : depth(d) { ++depth; }
    ~DepthScope() { --depth; }
  };

  try {
    auto guard = m_impl->storage.transaction_guard();
    bool commit = false;
    {
      DepthScope scope(m_impl->transactionDepth);
      commit = work();
    }
    if (commit)
      guard.commit();
    else
      guard.rollback();
    return commit;
  } catch (const std::exception &e) {
    std::cerr << "[DB] Transaction rolled back: " << e.what() << std::endl;
    return false;
  }
}

// Record operations
std::optional<SyncableRecord> DatabaseManager::getRecord(const std::string &id) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  auto row = m_impl->storage.get_optional<RecordRow>(id);
  if (!row)
    return std::nullopt;
  return fromRow(*row);
}

std::vector<SyncableRecord> DatabaseManager::getAllRecords(bool includeDeleted) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  std::vector<SyncableRecord> out;
  for (const auto &row : m_impl->storage.get_all<RecordRow>()) {
    if (includeDeleted || !row.deleted)
      out.push_back(fromRow(row));
  }
  return out;
}

std::vector<SyncableRecord>
DatabaseManager::getRecordsByType(RecordType type, bool includeDeleted) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  std::vector<SyncableRecord> out;
  auto rows = m_impl->storage.get_all<RecordRow>(
      where(c(&RecordRow::type) == toString(type)), order_by(&RecordRow::id));
  for (const auto &row : rows) {
    if (includeDeleted || !row.deleted)
      out.push_back(fromRow(row));
  }
  return out;
}

bool DatabaseManager::upsertRecord(const SyncableRecord &record) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  try {
    RecordRow row = toRow(record);
    auto existing = m_impl->storage.get_optional<RecordRow>(record.id);
    // Confirmations only survive while the record stays deleted.
    if (existing && existing->deleted && record.deleted)
      row.deleteConfirmations = existing->deleteConfirmations;
    m_impl->storage.replace(row);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] upsertRecord Error: " << e.what() << std::endl;
    return false;
  }
}

bool DatabaseManager::purgeRecord(const std::string &id) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  try {
    m_impl->storage.remove<RecordRow>(id);
    m_impl->storage.remove_all<ShadowRow>(where(c(&ShadowRow::recordId) == id));
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] purgeRecord Error: " << e.what() << std::endl;
    return false;
  }
}

bool DatabaseManager::confirmDeletion(const std::string &id, Origin origin) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  try {
    auto row = m_impl->storage.get_optional<RecordRow>(id);
    if (!row || !row->deleted)
      return true;
    row->deleteConfirmations |= originBit(origin);
    m_impl->storage.update(*row);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] confirmDeletion Error: " << e.what() << std::endl;
    return false;
  }
}

std::vector<std::string>
DatabaseManager::getConfirmedDeletions(const std::vector<Origin> &requiredOrigins) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  int32_t required = 0;
  for (Origin o : requiredOrigins)
    required |= originBit(o);

  std::vector<std::string> ids;
  auto rows =
      m_impl->storage.get_all<RecordRow>(where(c(&RecordRow::deleted) == true));
  for (const auto &row : rows) {
    if ((row.deleteConfirmations & required) == required)
      ids.push_back(row.id);
  }
  return ids;
}

// Shadow operations
std::optional<SyncableRecord> DatabaseManager::getShadow(const std::string &id,
                                                         Origin origin) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  auto row = m_impl->storage.get_optional<ShadowRow>(id, toString(origin));
  if (!row)
    return std::nullopt;
  return fromShadow(*row);
}

bool DatabaseManager::upsertShadow(const SyncableRecord &record, Origin origin) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  try {
    ShadowRow row;
    row.recordId = record.id;
    row.origin = toString(origin);
    row.type = toString(record.type);
    row.version = record.version;
    row.lastModified = record.lastModified;
    row.deleted = record.deleted;
    row.payload = record.payload;
    m_impl->storage.replace(row);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] upsertShadow Error: " << e.what() << std::endl;
    return false;
  }
}

// Journal operations
std::optional<int64_t> DatabaseManager::insertJournal(const PendingChange &change) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  try {
    return m_impl->storage.insert(toRow(change));
  } catch (const std::exception &e) {
    std::cerr << "[DB] insertJournal Error: " << e.what() << std::endl;
    return std::nullopt;
  }
}

std::vector<PendingChange> DatabaseManager::getJournal(Origin target) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  std::vector<PendingChange> out;
  auto rows = m_impl->storage.get_all<JournalRow>(
      where(c(&JournalRow::target) == toString(target)),
      order_by(&JournalRow::id));
  out.reserve(rows.size());
  for (const auto &row : rows)
    out.push_back(fromRow(row));
  return out;
}

std::optional<PendingChange> DatabaseManager::getJournalEntry(int64_t changeId) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  auto row = m_impl->storage.get_optional<JournalRow>(changeId);
  if (!row)
    return std::nullopt;
  return fromRow(*row);
}

bool DatabaseManager::updateJournal(const PendingChange &change) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  try {
    m_impl->storage.update(toRow(change));
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] updateJournal Error: " << e.what() << std::endl;
    return false;
  }
}

bool DatabaseManager::deleteJournal(int64_t changeId) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  try {
    m_impl->storage.remove<JournalRow>(changeId);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] deleteJournal Error: " << e.what() << std::endl;
    return false;
  }
}

bool DatabaseManager::hasPendingJournal(const std::string &recordId,
                                        Origin target) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  return m_impl->storage.count<JournalRow>(
             where(c(&JournalRow::recordId) == recordId &&
                   c(&JournalRow::target) == toString(target))) > 0;
}

// Cursor operations
std::string DatabaseManager::getCursor(Origin target) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  auto row = m_impl->storage.get_optional<CursorRow>(toString(target));
  return row ? row->cursor : std::string();
}

bool DatabaseManager::setCursor(Origin target, const std::string &cursor) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  try {
    CursorRow row;
    row.target = toString(target);
    row.cursor = cursor;
    row.updatedAt = static_cast<int64_t>(std::time(nullptr));
    m_impl->storage.replace(row);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] setCursor Error: " << e.what() << std::endl;
    return false;
  }
}

// Occurrence operations
std::vector<Occurrence> DatabaseManager::getOccurrences(Instant from,
                                                        Instant to) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  std::vector<Occurrence> out;
  auto rows = m_impl->storage.get_all<OccurrenceRow>(
      where(c(&OccurrenceRow::start) >= from && c(&OccurrenceRow::start) < to),
      order_by(&OccurrenceRow::start));
  for (const auto &row : rows)
    out.push_back(fromRow(row));
  return out;
}

bool DatabaseManager::replaceOccurrencesFrom(
    Instant from, const std::vector<Occurrence> &occurrences) {
  return transaction([&] {
    m_impl->storage.remove_all<OccurrenceRow>(
        where(c(&OccurrenceRow::start) >= from));
    for (const auto &occ : occurrences) {
      if (occ.start >= from)
        m_impl->storage.replace(toRow(occ));
    }
    return true;
  });
}

// Notification operations
std::vector<ScheduledNotification> DatabaseManager::getNotifications() {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  std::vector<ScheduledNotification> out;
  for (const auto &row : m_impl->storage.get_all<NotificationRow>(
           order_by(&NotificationRow::trigger))) {
    ScheduledNotification n;
    n.occurrenceId = row.occurrenceId;
    n.offsetSeconds = row.offsetSeconds;
    n.trigger = row.trigger;
    n.channel = row.channel;
    n.title = row.title;
    out.push_back(n);
  }
  return out;
}

bool DatabaseManager::upsertNotification(const ScheduledNotification &n) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  try {
    NotificationRow row{n.occurrenceId, n.offsetSeconds, n.trigger, n.channel,
                        n.title};
    m_impl->storage.replace(row);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] upsertNotification Error: " << e.what() << std::endl;
    return false;
  }
}

bool DatabaseManager::deleteNotification(const std::string &occurrenceId,
                                         int64_t offsetSeconds) {
  std::lock_guard<std::recursive_mutex> lock(m_impl->mutex);
  try {
    m_impl->storage.remove<NotificationRow>(occurrenceId, offsetSeconds);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] deleteNotification Error: " << e.what() << std::endl;
    return false;
  }
}

} // namespace calsync
