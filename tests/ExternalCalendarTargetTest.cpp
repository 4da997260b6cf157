#include "ExternalCalendarTarget.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>

using namespace calsync;
using calsync::test::at;
using calsync::test::dailySeries;
using calsync::test::FakeCalendarService;
using calsync::test::seriesRecord;

namespace {

PendingChange changeFor(const SyncableRecord &record, int64_t id,
                        ChangeOp op = ChangeOp::Update) {
  PendingChange change;
  change.changeId = id;
  change.target = Origin::ExternalCalendar;
  change.op = op;
  change.recordId = record.id;
  change.snapshot = record;
  return change;
}

SyncableRecord exceptionRecord(ExceptionKind kind) {
  OccurrenceException ex;
  ex.seriesId = "s1";
  ex.originalDate = CivilDate{2026, 1, 3};
  ex.kind = kind;
  ex.start = at(2026, 1, 3, 14);
  ex.end = at(2026, 1, 3, 15);
  ex.title = "Moved";

  SyncableRecord record;
  record.id = "s1@2026-01-03";
  record.type = RecordType::Exception;
  record.version = 2;
  record.lastModified = at(2026, 1, 2);
  record.payload = encodeException(ex);
  return record;
}

} // namespace

TEST(ExternalCalendarTargetTest, SeriesMapsToRecurringEvent) {
  SeriesPayload series = dailySeries("Standup", at(2026, 1, 5, 9), 900);
  series.segments[0].rule.frequency = Frequency::Weekly;
  series.segments[0].rule.interval = 2;
  auto record = seriesRecord("s1", 4, at(2026, 1, 1), series);

  auto event = ExternalCalendarTarget::toEvent(record);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->uid, "s1");
  EXPECT_FALSE(event->recurrenceId.has_value());
  EXPECT_EQ(event->sequence, 4);
  EXPECT_EQ(event->title, "Standup");
  EXPECT_EQ(event->start, at(2026, 1, 5, 9));
  EXPECT_EQ(event->end, at(2026, 1, 5, 9, 15));
  ASSERT_EQ(event->rules.size(), 1u);
  EXPECT_EQ(event->rules[0].rrule, "FREQ=WEEKLY;INTERVAL=2");

  auto back = ExternalCalendarTarget::toRecord(*event);
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(back->id, "s1");
  EXPECT_EQ(back->version, 4);
  EXPECT_EQ(back->origin, Origin::ExternalCalendar);
  auto decoded = decodeSeries(back->payload);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(decoded->recurring);
  EXPECT_EQ(decoded->segments[0].rule.frequency, Frequency::Weekly);
  EXPECT_EQ(decoded->segments[0].rule.interval, 2);
}

TEST(ExternalCalendarTargetTest, ExceptionMapsToInstanceOverride) {
  auto event = ExternalCalendarTarget::toEvent(exceptionRecord(ExceptionKind::Replace));
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->uid, "s1");
  ASSERT_TRUE(event->recurrenceId.has_value());
  EXPECT_EQ(civil::formatDate(*event->recurrenceId), "2026-01-03");
  EXPECT_FALSE(event->cancelledInstance);
  EXPECT_EQ(event->start, at(2026, 1, 3, 14));

  CalendarEvent cancelled = *event;
  cancelled.cancelledInstance = true;
  auto record = ExternalCalendarTarget::toRecord(cancelled);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->id, "s1@2026-01-03");
  EXPECT_EQ(record->type, RecordType::Exception);
  auto ex = decodeException(record->payload);
  ASSERT_TRUE(ex.has_value());
  EXPECT_EQ(ex->kind, ExceptionKind::Cancel);
}

TEST(ExternalCalendarTargetTest, UnparsableRRuleIsDropped) {
  CalendarEvent event;
  event.uid = "bad";
  event.rules.push_back(CalendarRule{at(2026, 1, 1), 3600, "FREQ=SECONDLY", {}});
  EXPECT_FALSE(ExternalCalendarTarget::toRecord(event).has_value());
}

TEST(ExternalCalendarTargetTest, InvalidRulesNeverLeaveThePull) {
  FakeCalendarService service;
  ExternalCalendarTarget target(service);
  CalendarEvent zeroInterval;
  zeroInterval.uid = "zero";
  zeroInterval.rules.push_back(
      CalendarRule{at(2026, 1, 1, 9), 3600, "FREQ=DAILY;INTERVAL=0", {}});
  CalendarEvent fromMonthEnd;
  fromMonthEnd.uid = "month-end";
  fromMonthEnd.rules.push_back(
      CalendarRule{at(2026, 1, 1, 9), 3600, "FREQ=MONTHLY;BYMONTHDAY=-1", {}});
  CalendarEvent fine;
  fine.uid = "fine";
  fine.rules.push_back(CalendarRule{at(2026, 1, 1, 9), 3600, "FREQ=WEEKLY", {}});
  service.pending = {zeroInterval, fromMonthEnd, fine};

  PullResult result = target.pull("");
  ASSERT_FALSE(result.error.has_value());
  ASSERT_EQ(result.changes.size(), 1u);
  EXPECT_EQ(result.changes[0].id, "fine");
}

TEST(ExternalCalendarTargetTest, PushWritesEventsAndSkipsTasks) {
  FakeCalendarService service;
  ExternalCalendarTarget target(service);
  auto event = seriesRecord("s1", 1, at(2026, 1, 1),
                            dailySeries("Standup", at(2026, 1, 1, 9)));
  auto task = seriesRecord("t1", 1, at(2026, 1, 1),
                           dailySeries("Water plants", at(2026, 1, 1, 18), 0,
                                       ItemKind::Task));

  auto response = target.push({changeFor(event, 1), changeFor(task, 2)});
  ASSERT_FALSE(response.error.has_value());
  ASSERT_EQ(response.results.size(), 2u);
  EXPECT_EQ(response.results[0].outcome, PushOutcome::Ack);
  EXPECT_EQ(response.results[1].outcome, PushOutcome::Ack);
  ASSERT_EQ(service.upserts.size(), 1u);
  EXPECT_EQ(service.upserts[0].uid, "s1");
}

TEST(ExternalCalendarTargetTest, DeletionsCallDeleteEvent) {
  FakeCalendarService service;
  ExternalCalendarTarget target(service);
  auto series = seriesRecord("s1", 3, at(2026, 1, 1),
                             dailySeries("Standup", at(2026, 1, 1, 9)));
  series.deleted = true;
  auto exception = exceptionRecord(ExceptionKind::Cancel);
  exception.deleted = true;

  auto response = target.push({changeFor(series, 1, ChangeOp::Delete),
                               changeFor(exception, 2, ChangeOp::Delete)});
  ASSERT_EQ(response.results.size(), 2u);
  EXPECT_TRUE(service.upserts.empty());
  EXPECT_EQ(service.deletes,
            (std::vector<std::string>{"s1", "s1@2026-01-03"}));
}

TEST(ExternalCalendarTargetTest, ConflictCarriesCalendarCopy) {
  FakeCalendarService service;
  ExternalCalendarTarget target(service);
  CalendarEvent current;
  current.uid = "s1";
  current.sequence = 7;
  current.title = "Edited in calendar";
  current.start = at(2026, 1, 1, 10);
  current.end = at(2026, 1, 1, 11);
  service.writeResult.conflict = true;
  service.writeResult.current = current;

  auto record = seriesRecord("s1", 2, at(2026, 1, 1),
                             dailySeries("Standup", at(2026, 1, 1, 9)));
  auto response = target.push({changeFor(record, 9)});
  ASSERT_EQ(response.results.size(), 1u);
  EXPECT_EQ(response.results[0].changeId, 9);
  EXPECT_EQ(response.results[0].outcome, PushOutcome::Conflict);
  ASSERT_TRUE(response.results[0].current.has_value());
  EXPECT_EQ(response.results[0].current->version, 7);
}

TEST(ExternalCalendarTargetTest, DeniedWriteFailsWholeBatch) {
  FakeCalendarService service;
  ExternalCalendarTarget target(service);
  service.writeResult.error =
      SyncError{SyncErrorKind::AuthorizationDenied, "calendar access revoked"};

  auto record = seriesRecord("s1", 1, at(2026, 1, 1),
                             dailySeries("Standup", at(2026, 1, 1, 9)));
  auto response = target.push({changeFor(record, 1)});
  ASSERT_TRUE(response.error.has_value());
  EXPECT_EQ(response.error->kind, SyncErrorKind::AuthorizationDenied);
  EXPECT_TRUE(response.results.empty());
}

TEST(ExternalCalendarTargetTest, AuthorizeRequestsAccessOnce) {
  FakeCalendarService service;
  ExternalCalendarTarget target(service);
  service.state = AuthorizationState::NotRequested;
  service.grantOnRequest = AuthorizationState::WriteOnly;

  EXPECT_EQ(target.authorize(), AuthorizationState::WriteOnly);
  EXPECT_EQ(target.authorize(), AuthorizationState::WriteOnly);
  EXPECT_EQ(service.accessRequests, 1);
}

TEST(ExternalCalendarTargetTest, PullMapsEventsAndToken) {
  FakeCalendarService service;
  ExternalCalendarTarget target(service);
  CalendarEvent event;
  event.uid = "cal-1";
  event.sequence = 1;
  event.title = "Dentist";
  event.start = at(2026, 2, 3, 15);
  event.end = at(2026, 2, 3, 16);
  service.pending = {event};
  service.nextToken = "token-7";

  auto result = target.pull("token-6");
  ASSERT_FALSE(result.error.has_value());
  EXPECT_EQ(service.lastToken, "token-6");
  EXPECT_EQ(result.newCursor, "token-7");
  ASSERT_EQ(result.changes.size(), 1u);
  EXPECT_EQ(result.changes[0].id, "cal-1");
  auto series = decodeSeries(result.changes[0].payload);
  ASSERT_TRUE(series.has_value());
  EXPECT_FALSE(series->recurring);
  ASSERT_EQ(series->segments.size(), 1u);
  EXPECT_EQ(series->segments[0].durationSeconds, 3600);
}
