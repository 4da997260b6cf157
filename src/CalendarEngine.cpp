#include "CalendarEngine.hpp"
#include "CivilTime.hpp"
#include "RecurrenceExpander.hpp"
#include "RecurrenceRules.hpp"
#include "Serialization.hpp"
#include "UuidUtils.hpp"
#include <algorithm>
#include <iostream>

namespace calsync {

namespace {

// Daily summaries are only planned a week ahead.
constexpr int32_t kSummaryDays = 7;

struct OccurrenceKey {
  std::string seriesId;
  CivilDate date;
};

std::optional<OccurrenceKey> splitOccurrenceId(const std::string &id) {
  auto at = id.rfind('@');
  if (at == std::string::npos || at == 0)
    return std::nullopt;
  auto date = civil::parseDate(id.substr(at + 1));
  if (!date)
    return std::nullopt;
  return OccurrenceKey{id.substr(0, at), *date};
}

CommandResult failure(const std::string &error) {
  std::cerr << "[Engine] " << error << std::endl;
  return CommandResult{false, "", error};
}

CommandResult success(const std::string &id) {
  return CommandResult{true, id, ""};
}

} // namespace

CalendarEngine::CalendarEngine(DatabaseManager &db, ChangeJournal &journal,
                               NotificationScheduler &notifications,
                               EngineSettings settings, Clock clock)
    : m_db(db), m_journal(journal), m_notifications(notifications),
      m_settings(settings), m_clock(std::move(clock)) {}

void CalendarEngine::attach(SyncCoordinator &coordinator) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_coordinators.push_back(&coordinator);
  coordinator.setPolicy(m_settings.policy);
  coordinator.setRouter([this](const SyncableRecord &record, Origin target) {
    return routes(record, target);
  });
  coordinator.setOnApplied([this](const std::vector<SyncableRecord> &records) {
    std::cout << "[Engine] " << records.size()
              << " record(s) changed by sync, refreshing" << std::endl;
    refresh();
  });

  for (auto *c : m_coordinators) {
    std::vector<Origin> peers;
    for (auto *other : m_coordinators) {
      if (other != c)
        peers.push_back(other->origin());
    }
    c->setPeers(peers);
  }
}

std::vector<Origin> CalendarEngine::targets() const {
  std::vector<Origin> out;
  for (auto *c : m_coordinators)
    out.push_back(c->origin());
  return out;
}

bool CalendarEngine::routes(const SyncableRecord &record, Origin target) {
  if (target != Origin::ExternalCalendar)
    return true;

  // The system calendar only carries events.
  std::string seriesPayload = record.payload;
  if (record.type == RecordType::Exception) {
    auto ex = decodeException(record.payload);
    if (!ex)
      return false;
    auto series = m_db.getRecord(ex->seriesId);
    if (!series)
      return false;
    seriesPayload = series->payload;
  }
  auto series = decodeSeries(seriesPayload);
  return series && series->kind == ItemKind::Event;
}

std::vector<Origin> CalendarEngine::targetsFor(const SyncableRecord &record) {
  std::vector<Origin> out;
  for (Origin target : targets()) {
    if (routes(record, target))
      out.push_back(target);
  }
  return out;
}

bool CalendarEngine::commit(const SyncableRecord &record, ChangeOp op) {
  return m_db.transaction([&] {
    return m_db.upsertRecord(record) &&
           m_journal.append(op, record, targetsFor(record), record.lastModified);
  });
}

std::optional<SeriesPayload>
CalendarEngine::liveSeries(const std::string &seriesId, SyncableRecord &record,
                           std::string &error) {
  auto stored = m_db.getRecord(seriesId);
  if (!stored || stored->deleted || stored->type != RecordType::Series) {
    error = "unknown series " + seriesId;
    return std::nullopt;
  }
  auto series = decodeSeries(stored->payload);
  if (!series) {
    error = "unreadable series " + seriesId;
    return std::nullopt;
  }
  record = *stored;
  return series;
}

std::optional<Occurrence>
CalendarEngine::generatedOccurrence(const std::string &seriesId,
                                    const SeriesPayload &series,
                                    const CivilDate &date) {
  Instant dayStart = civil::atTime(date, 0);
  for (auto &occ : expandSeries(seriesId, series, dayStart,
                                dayStart + civil::kSecondsPerDay, {})) {
    if (occ.originalDate == date)
      return occ;
  }
  return std::nullopt;
}

CommandResult CalendarEngine::createSeries(const SeriesDraft &draft) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (draft.durationSeconds < 0)
    return failure("duration must not be negative");
  if (draft.recurring) {
    if (auto problem = validateRule(draft.rule, draft.start))
      return failure("invalid rule: " + problem->message);
  }

  SeriesPayload series;
  series.kind = draft.kind;
  series.title = draft.title;
  series.notes = draft.notes;
  series.category = draft.category;
  series.recurring = draft.recurring;
  RuleSegment segment;
  if (draft.recurring)
    segment.rule = draft.rule;
  segment.anchor = draft.start;
  segment.durationSeconds = draft.durationSeconds;
  series.segments.push_back(segment);

  SyncableRecord record;
  record.id = UuidUtils::generate();
  record.type = RecordType::Series;
  record.origin = Origin::Local;
  record.version = 1;
  record.lastModified = m_clock();
  record.payload = encodeSeries(series);

  if (!commit(record, ChangeOp::Create))
    return failure("could not store series " + record.id);
  std::cout << "[Engine] Created series " << record.id << " \"" << draft.title
            << "\"" << std::endl;
  refreshLocked();
  return success(record.id);
}

CommandResult CalendarEngine::editSeries(const std::string &seriesId,
                                         const SeriesEdit &edit) {
  std::lock_guard<std::mutex> lock(m_mutex);
  SyncableRecord record;
  std::string error;
  auto series = liveSeries(seriesId, record, error);
  if (!series)
    return failure(error);

  if (edit.title)
    series->title = *edit.title;
  if (edit.notes)
    series->notes = *edit.notes;
  if (edit.category)
    series->category = *edit.category;

  record.payload = encodeSeries(*series);
  record.version += 1;
  record.lastModified = m_clock();
  record.origin = Origin::Local;
  if (!commit(record, ChangeOp::Update))
    return failure("could not store series " + seriesId);
  refreshLocked();
  return success(seriesId);
}

CommandResult CalendarEngine::replaceRule(const std::string &seriesId,
                                          const RecurrenceRule &rule,
                                          Instant anchor,
                                          int64_t durationSeconds) {
  std::lock_guard<std::mutex> lock(m_mutex);
  SyncableRecord record;
  std::string error;
  auto series = liveSeries(seriesId, record, error);
  if (!series)
    return failure(error);
  if (durationSeconds < 0)
    return failure("duration must not be negative");
  if (auto problem = validateRule(rule, anchor))
    return failure("invalid rule: " + problem->message);

  RuleSegment next;
  next.rule = rule;
  next.anchor = anchor;
  next.durationSeconds = durationSeconds;

  if (!series->recurring) {
    series->segments.clear();
  } else {
    // Close the running rule at the start of the new anchor's day.
    Instant split = civil::atTime(civil::dateOf(anchor), 0);
    while (!series->segments.empty() &&
           series->segments.back().anchor >= split)
      series->segments.pop_back();
    if (!series->segments.empty()) {
      auto &last = series->segments.back();
      last.effectiveUntil =
          last.effectiveUntil ? std::min(*last.effectiveUntil, split) : split;
    }
  }
  series->recurring = true;
  series->segments.push_back(next);

  record.payload = encodeSeries(*series);
  record.version += 1;
  record.lastModified = m_clock();
  record.origin = Origin::Local;
  if (!commit(record, ChangeOp::Update))
    return failure("could not store series " + seriesId);
  std::cout << "[Engine] Replaced rule of " << seriesId << " from "
            << civil::formatInstant(anchor) << " (" << toRRule(rule) << ")"
            << std::endl;
  refreshLocked();
  return success(seriesId);
}

CommandResult CalendarEngine::deleteSeries(const std::string &seriesId) {
  std::lock_guard<std::mutex> lock(m_mutex);
  SyncableRecord record;
  std::string error;
  if (!liveSeries(seriesId, record, error))
    return failure(error);

  Instant now = m_clock();
  bool stored = m_db.transaction([&] {
    for (auto child : m_db.getRecordsByType(RecordType::Exception)) {
      auto ex = decodeException(child.payload);
      if (!ex || ex->seriesId != seriesId)
        continue;
      child.deleted = true;
      child.version += 1;
      child.lastModified = now;
      child.origin = Origin::Local;
      if (!commit(child, ChangeOp::Delete))
        return false;
    }
    record.deleted = true;
    record.version += 1;
    record.lastModified = now;
    record.origin = Origin::Local;
    return commit(record, ChangeOp::Delete);
  });
  if (!stored)
    return failure("could not delete series " + seriesId);
  std::cout << "[Engine] Deleted series " << seriesId << std::endl;
  refreshLocked();
  return success(seriesId);
}

CommandResult
CalendarEngine::writeException(const std::string &occurrenceId,
                               ExceptionKind kind,
                               const std::optional<OccurrenceEdit> &edit,
                               bool toggleCompleted) {
  auto key = splitOccurrenceId(occurrenceId);
  if (!key)
    return failure("malformed occurrence id " + occurrenceId);

  SyncableRecord seriesRecord;
  std::string error;
  auto series = liveSeries(key->seriesId, seriesRecord, error);
  if (!series)
    return failure(error);
  auto generated = generatedOccurrence(key->seriesId, *series, key->date);
  if (!generated)
    return failure("series " + key->seriesId + " has no occurrence on " +
                   civil::formatDate(key->date));

  auto stored = m_db.getRecord(occurrenceId);
  bool live = stored && !stored->deleted;
  OccurrenceException ex;
  ex.seriesId = key->seriesId;
  ex.originalDate = key->date;
  ex.kind = ExceptionKind::Replace;
  ex.start = generated->start;
  ex.end = generated->end;
  if (live) {
    auto existing = decodeException(stored->payload);
    if (!existing)
      return failure("unreadable exception " + occurrenceId);
    ex = *existing;
  }

  if (toggleCompleted) {
    if (series->kind != ItemKind::Task)
      return failure("only task occurrences can be completed");
    if (ex.kind == ExceptionKind::Cancel)
      return failure("occurrence " + occurrenceId + " is cancelled");
    ex.completed = !ex.completed;
  } else if (kind == ExceptionKind::Cancel) {
    ex.kind = ExceptionKind::Cancel;
  } else {
    if (ex.kind == ExceptionKind::Cancel)
      return failure("occurrence " + occurrenceId + " is cancelled");
    if (edit->end < edit->start)
      return failure("occurrence must not end before it starts");
    ex.kind = ExceptionKind::Replace;
    ex.start = edit->start;
    ex.end = edit->end;
    if (edit->title)
      ex.title = edit->title;
  }

  SyncableRecord record;
  record.id = occurrenceId;
  record.type = RecordType::Exception;
  record.origin = Origin::Local;
  record.version = stored ? stored->version + 1 : 1;
  record.lastModified = m_clock();
  record.payload = encodeException(ex);

  if (!commit(record, live ? ChangeOp::Update : ChangeOp::Create))
    return failure("could not store exception " + occurrenceId);
  refreshLocked();
  return success(occurrenceId);
}

CommandResult CalendarEngine::editOccurrence(const std::string &occurrenceId,
                                             const OccurrenceEdit &edit) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return writeException(occurrenceId, ExceptionKind::Replace, edit, false);
}

CommandResult CalendarEngine::cancelOccurrence(const std::string &occurrenceId) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return writeException(occurrenceId, ExceptionKind::Cancel, std::nullopt,
                        false);
}

CommandResult CalendarEngine::toggleCompletion(const std::string &occurrenceId) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return writeException(occurrenceId, ExceptionKind::Replace, std::nullopt,
                        true);
}

CommandResult CalendarEngine::resetOccurrence(const std::string &occurrenceId) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto stored = m_db.getRecord(occurrenceId);
  if (!stored || stored->deleted || stored->type != RecordType::Exception)
    return failure("occurrence " + occurrenceId + " has no exception");

  SyncableRecord record = *stored;
  record.deleted = true;
  record.version += 1;
  record.lastModified = m_clock();
  record.origin = Origin::Local;
  if (!commit(record, ChangeOp::Delete))
    return failure("could not reset " + occurrenceId);
  refreshLocked();
  return success(occurrenceId);
}

void CalendarEngine::setConflictPolicy(ConflictPolicy policy) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_settings.policy = policy;
  for (auto *c : m_coordinators)
    c->setPolicy(policy);
  std::cout << "[Engine] Conflict policy set to " << toString(policy)
            << std::endl;
}

ConflictPolicy CalendarEngine::conflictPolicy() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_settings.policy;
}

void CalendarEngine::syncNow() {
  for (auto *c : m_coordinators)
    c->requestSync();
}

void CalendarEngine::reauthorize(Origin target) {
  for (auto *c : m_coordinators) {
    if (c->origin() == target)
      c->reauthorize();
  }
}

bool CalendarEngine::retryFailures() {
  Instant now = m_clock();
  bool ok = true;
  for (Origin target : targets())
    ok = m_journal.retryFailed(target, now) && ok;
  syncNow();
  return ok;
}

size_t CalendarEngine::purgeConfirmedDeletions() {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto required = targets();
  size_t purged = 0;
  for (const auto &id : m_db.getConfirmedDeletions(required)) {
    bool pending = std::any_of(required.begin(), required.end(),
                               [&](Origin o) { return m_journal.hasPending(id, o); });
    if (pending)
      continue;
    if (m_db.purgeRecord(id))
      ++purged;
  }
  if (purged > 0)
    std::cout << "[Engine] Purged " << purged << " deleted record(s)"
              << std::endl;
  return purged;
}

std::map<std::string, std::vector<OccurrenceException>>
CalendarEngine::loadExceptions() {
  std::map<std::string, std::vector<OccurrenceException>> bySeries;
  for (const auto &record : m_db.getRecordsByType(RecordType::Exception)) {
    auto ex = decodeException(record.payload);
    if (ex)
      bySeries[ex->seriesId].push_back(*ex);
  }
  return bySeries;
}

std::vector<Occurrence> CalendarEngine::occurrencesLocked(Instant from,
                                                          Instant to) {
  auto exceptions = loadExceptions();
  std::vector<Occurrence> out;
  for (const auto &record : m_db.getRecordsByType(RecordType::Series)) {
    auto series = decodeSeries(record.payload);
    if (!series)
      continue;
    auto expanded =
        expandSeries(record.id, *series, from, to, exceptions[record.id]);
    out.insert(out.end(), expanded.begin(), expanded.end());
  }
  std::sort(out.begin(), out.end(), [](const Occurrence &a, const Occurrence &b) {
    return a.start != b.start ? a.start < b.start : a.id < b.id;
  });
  return out;
}

std::vector<Occurrence> CalendarEngine::occurrences(Instant from, Instant to) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return occurrencesLocked(from, to);
}

std::optional<SyncStatus> CalendarEngine::status(Origin target) const {
  for (auto *c : m_coordinators) {
    if (c->origin() == target)
      return c->status();
  }
  return std::nullopt;
}

std::vector<PendingChange> CalendarEngine::syncFailures() {
  std::vector<PendingChange> out;
  for (Origin target : targets()) {
    auto failed = m_journal.failures(target);
    out.insert(out.end(), failed.begin(), failed.end());
  }
  return out;
}

size_t CalendarEngine::pendingNotificationCount() {
  return m_notifications.pendingCount();
}

bool CalendarEngine::remindersDegraded() const {
  return m_notifications.degraded();
}

bool CalendarEngine::refresh() {
  std::lock_guard<std::mutex> lock(m_mutex);
  return refreshLocked();
}

bool CalendarEngine::refreshLocked() {
  try {
    Instant now = m_clock();
    Instant from = now - civil::kSecondsPerDay;
    Instant to = now + m_settings.horizonDays * civil::kSecondsPerDay;

    auto current = occurrencesLocked(from, to);
    bool stored = m_db.replaceOccurrencesFrom(now, current);
    if (!stored)
      std::cerr << "[Engine] Could not materialize occurrences" << std::endl;

    auto summaries =
        dailySummaryOccurrences(now, std::min(m_settings.horizonDays, kSummaryDays),
                                m_notifications.settings());
    current.insert(current.end(), summaries.begin(), summaries.end());
    bool notified = m_notifications.refresh(current);
    return stored && notified;
  } catch (const std::exception &e) {
    std::cerr << "[Engine] Refresh failed: " << e.what() << std::endl;
    return false;
  }
}

} // namespace calsync
