#pragma once
#include "CalendarService.hpp"
#include "SyncTarget.hpp"
#include <optional>

namespace calsync {

/**
 * Presents the system calendar as a SyncTarget. Series records become
 * recurring calendar events (one RRULE per rule segment), exception records
 * become per-instance overrides. The iCalendar SEQUENCE carries the record
 * version. Only event-kind series are mapped; tasks are acknowledged
 * without a calendar write.
 */
class ExternalCalendarTarget : public SyncTarget {
public:
  explicit ExternalCalendarTarget(CalendarService &service);

  Origin origin() const override { return Origin::ExternalCalendar; }
  std::string name() const override { return "calendar"; }

  AuthorizationState authorize() override;
  PullResult pull(const std::string &cursor) override;
  PushResponse push(const std::vector<PendingChange> &batch) override;

  void cancel() override { m_service.cancel(); }
  void resume() override { m_service.resume(); }

  static std::optional<CalendarEvent> toEvent(const SyncableRecord &record);
  static std::optional<SyncableRecord> toRecord(const CalendarEvent &event);

private:
  CalendarService &m_service;
};

} // namespace calsync
