#include "ExternalCalendarTarget.hpp"
#include "RecurrenceExpander.hpp"
#include "RecurrenceRules.hpp"
#include "Serialization.hpp"
#include <iostream>

namespace calsync {

ExternalCalendarTarget::ExternalCalendarTarget(CalendarService &service)
    : m_service(service) {}

AuthorizationState ExternalCalendarTarget::authorize() {
  AuthorizationState state = m_service.authorizationState();
  if (state == AuthorizationState::NotRequested) {
    std::cout << "[Calendar] Requesting calendar access" << std::endl;
    state = m_service.requestAccess();
  }
  return state;
}

std::optional<CalendarEvent>
ExternalCalendarTarget::toEvent(const SyncableRecord &record) {
  CalendarEvent event;
  event.sequence = record.version;
  event.lastModified = record.lastModified;
  event.deleted = record.deleted;

  if (record.type == RecordType::Series) {
    auto series = decodeSeries(record.payload);
    if (!series || series->segments.empty())
      return std::nullopt;
    event.uid = record.id;
    event.title = series->title;
    event.notes = series->notes;
    event.category = series->category;
    event.start = series->segments.front().anchor;
    event.end = event.start + series->segments.front().durationSeconds;
    for (const auto &segment : series->segments) {
      CalendarRule rule;
      rule.dtstart = segment.anchor;
      rule.durationSeconds = segment.durationSeconds;
      if (series->recurring)
        rule.rrule = toRRule(segment.rule);
      rule.effectiveUntil = segment.effectiveUntil;
      event.rules.push_back(rule);
    }
    return event;
  }

  auto ex = decodeException(record.payload);
  if (!ex)
    return std::nullopt;
  event.uid = ex->seriesId;
  event.recurrenceId = ex->originalDate;
  event.cancelledInstance = ex->kind == ExceptionKind::Cancel;
  event.start = ex->start;
  event.end = ex->end;
  event.title = ex->title.value_or("");
  return event;
}

std::optional<SyncableRecord>
ExternalCalendarTarget::toRecord(const CalendarEvent &event) {
  SyncableRecord record;
  record.origin = Origin::ExternalCalendar;
  record.version = event.sequence;
  record.lastModified = event.lastModified;
  record.deleted = event.deleted;

  if (event.recurrenceId) {
    OccurrenceException ex;
    ex.seriesId = event.uid;
    ex.originalDate = *event.recurrenceId;
    ex.kind = event.cancelledInstance ? ExceptionKind::Cancel
                                      : ExceptionKind::Replace;
    ex.start = event.start;
    ex.end = event.end;
    if (!event.title.empty())
      ex.title = event.title;
    record.id = occurrenceId(event.uid, *event.recurrenceId);
    record.type = RecordType::Exception;
    record.payload = encodeException(ex);
    return record;
  }

  SeriesPayload series;
  series.kind = ItemKind::Event;
  series.title = event.title;
  series.notes = event.notes;
  series.category = event.category;
  series.recurring = false;
  for (const auto &rule : event.rules) {
    RuleSegment segment;
    segment.anchor = rule.dtstart;
    segment.durationSeconds = rule.durationSeconds;
    segment.effectiveUntil = rule.effectiveUntil;
    if (!rule.rrule.empty()) {
      auto parsed = parseRRule(rule.rrule);
      if (!parsed) {
        std::cerr << "[Calendar] Unparsable RRULE on " << event.uid << ": "
                  << rule.rrule << std::endl;
        return std::nullopt;
      }
      if (auto error = validateRule(*parsed, rule.dtstart)) {
        std::cerr << "[Calendar] Invalid RRULE on " << event.uid << ": "
                  << error->message << std::endl;
        return std::nullopt;
      }
      segment.rule = *parsed;
      series.recurring = true;
    }
    series.segments.push_back(segment);
  }
  if (series.segments.empty()) {
    RuleSegment single;
    single.anchor = event.start;
    single.durationSeconds = event.end - event.start;
    series.segments.push_back(single);
  }
  record.id = event.uid;
  record.type = RecordType::Series;
  record.payload = encodeSeries(series);
  return record;
}

PullResult ExternalCalendarTarget::pull(const std::string &cursor) {
  PullResult result;
  CalendarChanges changes = m_service.listChangedEvents(cursor);
  if (changes.error) {
    result.error = changes.error;
    return result;
  }
  for (const auto &event : changes.events) {
    auto record = toRecord(event);
    if (record)
      result.changes.push_back(std::move(*record));
  }
  result.newCursor = changes.syncToken;
  result.hasMore = changes.hasMore;
  return result;
}

PushResponse ExternalCalendarTarget::push(const std::vector<PendingChange> &batch) {
  PushResponse response;
  for (const auto &change : batch) {
    PushResult result;
    result.changeId = change.changeId;

    if (change.snapshot.type == RecordType::Series) {
      auto series = decodeSeries(change.snapshot.payload);
      if (series && series->kind == ItemKind::Task) {
        result.outcome = PushOutcome::Ack;
        response.results.push_back(result);
        continue;
      }
    }

    auto event = toEvent(change.snapshot);
    if (!event) {
      result.outcome = PushOutcome::Error;
      result.message = "record cannot be mapped to a calendar event";
      response.results.push_back(result);
      continue;
    }

    CalendarWriteResult write =
        change.snapshot.deleted
            ? m_service.deleteEvent(event->uid, event->recurrenceId,
                                    event->sequence)
            : m_service.upsertEvent(*event);

    if (write.error) {
      SyncErrorKind kind = write.error->kind;
      if (kind == SyncErrorKind::Cancelled ||
          kind == SyncErrorKind::AuthorizationDenied) {
        response.results.clear();
        response.error = write.error;
        return response;
      }
      result.outcome = PushOutcome::Error;
      result.message = write.error->message;
    } else if (write.conflict && write.current) {
      auto current = toRecord(*write.current);
      if (current) {
        result.outcome = PushOutcome::Conflict;
        result.current = current;
      } else {
        result.outcome = PushOutcome::Error;
        result.message = "unreadable conflicting event";
      }
    } else {
      result.outcome = PushOutcome::Ack;
    }
    response.results.push_back(std::move(result));
  }
  return response;
}

} // namespace calsync
