#pragma once
#include "CalendarService.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace calsync {

struct CalendarBridgeSettings {
  std::string baseUrl = "http://localhost:3100";
  std::string calendarId = "calsync";
  int connectTimeoutSeconds = 5;
  int readTimeoutSeconds = 20;
};

/**
 * CalendarService over the local calendar bridge's HTTP interface
 * (cpp-httplib + nlohmann/json). Events travel with RRULE text and
 * iCalendar SEQUENCE numbers.
 *
 *   GET    /calendars/{id}/authorization          -> {state}
 *   POST   /calendars/{id}/authorization          -> {state}
 *   GET    /calendars/{id}/events?syncToken=      -> {events, syncToken, hasMore}
 *   PUT    /calendars/{id}/events/{uid}           200 | 409 {event}
 *   DELETE /calendars/{id}/events/{uid}?recurrenceId=&sequence=
 */
class CalendarBridgeClient : public CalendarService {
public:
  explicit CalendarBridgeClient(const CalendarBridgeSettings &settings);
  ~CalendarBridgeClient() override;

  AuthorizationState authorizationState() override;
  AuthorizationState requestAccess() override;
  CalendarChanges listChangedEvents(const std::string &syncToken) override;
  CalendarWriteResult upsertEvent(const CalendarEvent &event) override;
  CalendarWriteResult deleteEvent(const std::string &uid,
                                  const std::optional<CivilDate> &recurrenceId,
                                  int64_t sequence) override;

  void cancel() override;
  void resume() override;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  CalendarBridgeSettings m_settings;
  std::atomic<bool> m_cancelled{false};

  std::string eventsPath() const;
  SyncError transportError(int status, const std::string &what) const;
  CalendarWriteResult writeResult(int status, const std::string &body,
                                  const std::string &what);
};

// Wire form used by the bridge.
std::string eventToJson(const CalendarEvent &event);
std::optional<CalendarEvent> eventFromJson(const std::string &body);

} // namespace calsync
