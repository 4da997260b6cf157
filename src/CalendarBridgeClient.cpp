#include "CalendarBridgeClient.hpp"
#include "ApiClient.hpp"
#include "CivilTime.hpp"
#include "Serialization.hpp"
#include "httplib.h"
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace calsync {

namespace {

json toJson(const CalendarEvent &event) {
  json j;
  j["uid"] = event.uid;
  if (event.recurrenceId)
    j["recurrenceId"] = civil::formatDate(*event.recurrenceId);
  j["sequence"] = event.sequence;
  j["lastModified"] = civil::formatInstant(event.lastModified);
  j["deleted"] = event.deleted;
  j["cancelledInstance"] = event.cancelledInstance;
  j["title"] = event.title;
  j["notes"] = event.notes;
  j["category"] = event.category;
  j["start"] = civil::formatInstant(event.start);
  j["end"] = civil::formatInstant(event.end);
  j["rules"] = json::array();
  for (const auto &rule : event.rules) {
    json r{{"dtstart", civil::formatInstant(rule.dtstart)},
           {"duration", rule.durationSeconds},
           {"rrule", rule.rrule}};
    if (rule.effectiveUntil)
      r["effectiveUntil"] = civil::formatInstant(*rule.effectiveUntil);
    j["rules"].push_back(r);
  }
  return j;
}

CalendarEvent fromJson(const json &j) {
  CalendarEvent event;
  event.uid = j.at("uid").get<std::string>();
  if (j.contains("recurrenceId") && !j.at("recurrenceId").is_null())
    event.recurrenceId = j.at("recurrenceId").get<CivilDate>();
  event.sequence = j.value("sequence", int64_t{0});
  event.lastModified = instantFromJson(j.at("lastModified"));
  event.deleted = j.value("deleted", false);
  event.cancelledInstance = j.value("cancelledInstance", false);
  event.title = j.value("title", "");
  event.notes = j.value("notes", "");
  event.category = j.value("category", "");
  if (j.contains("start"))
    event.start = instantFromJson(j.at("start"));
  if (j.contains("end"))
    event.end = instantFromJson(j.at("end"));
  if (j.contains("rules")) {
    for (const auto &r : j.at("rules")) {
      CalendarRule rule;
      rule.dtstart = instantFromJson(r.at("dtstart"));
      rule.durationSeconds = r.value("duration", int64_t{0});
      rule.rrule = r.value("rrule", "");
      if (r.contains("effectiveUntil") && !r.at("effectiveUntil").is_null())
        rule.effectiveUntil = instantFromJson(r.at("effectiveUntil"));
      event.rules.push_back(rule);
    }
  }
  return event;
}

} // namespace

std::string eventToJson(const CalendarEvent &event) {
  return toJson(event).dump();
}

std::optional<CalendarEvent> eventFromJson(const std::string &body) {
  try {
    return fromJson(json::parse(body));
  } catch (const std::exception &e) {
    std::cerr << "[Calendar] JSON Parse Error: " << e.what() << std::endl;
    return std::nullopt;
  }
}

struct CalendarBridgeClient::Impl {
  httplib::Client client;
  Impl(const CalendarBridgeSettings &s) : client(s.baseUrl) {
    client.set_connection_timeout(s.connectTimeoutSeconds, 0);
    client.set_read_timeout(s.readTimeoutSeconds, 0);
    client.set_write_timeout(s.readTimeoutSeconds, 0);
  }
};

CalendarBridgeClient::CalendarBridgeClient(
    const CalendarBridgeSettings &settings)
    : m_impl(std::make_unique<Impl>(settings)), m_settings(settings) {}

CalendarBridgeClient::~CalendarBridgeClient() = default;

std::string CalendarBridgeClient::eventsPath() const {
  return "/calendars/" + urlEncode(m_settings.calendarId) + "/events";
}

void CalendarBridgeClient::cancel() {
  m_cancelled = true;
  m_impl->client.stop();
}

void CalendarBridgeClient::resume() { m_cancelled = false; }

SyncError CalendarBridgeClient::transportError(int status,
                                               const std::string &what) const {
  if (m_cancelled)
    return {SyncErrorKind::Cancelled, what + " cancelled"};
  if (status == 401 || status == 403)
    return {SyncErrorKind::AuthorizationDenied,
            what + ": calendar access denied"};
  if (status >= 400 && status < 500 && status != 408 && status != 429)
    return {SyncErrorKind::Malformed,
            what + " rejected with status " + std::to_string(status)};
  return {SyncErrorKind::Transient,
          what + " failed with status " + std::to_string(status)};
}

AuthorizationState CalendarBridgeClient::authorizationState() {
  std::string path =
      "/calendars/" + urlEncode(m_settings.calendarId) + "/authorization";
  auto res = m_impl->client.Get(path.c_str());
  if (res && res->status == 200) {
    try {
      auto state = authorizationStateFromString(
          json::parse(res->body).value("state", "not-requested"));
      if (state)
        return *state;
    } catch (const std::exception &e) {
      std::cerr << "[Calendar] JSON Parse Error: " << e.what() << std::endl;
    }
  } else if (res && (res->status == 401 || res->status == 403)) {
    return AuthorizationState::Denied;
  }
  std::cerr << "[Calendar] Authorization query failed with status: "
            << (res ? res->status : -1) << std::endl;
  return AuthorizationState::NotRequested;
}

AuthorizationState CalendarBridgeClient::requestAccess() {
  std::string path =
      "/calendars/" + urlEncode(m_settings.calendarId) + "/authorization";
  auto res = m_impl->client.Post(path.c_str(), "{}", "application/json");
  if (res && res->status == 200) {
    try {
      auto state = authorizationStateFromString(
          json::parse(res->body).value("state", "denied"));
      if (state)
        return *state;
    } catch (const std::exception &e) {
      std::cerr << "[Calendar] JSON Parse Error: " << e.what() << std::endl;
    }
  }
  std::cerr << "[Calendar] Access request failed with status: "
            << (res ? res->status : -1) << std::endl;
  return AuthorizationState::NotRequested;
}

CalendarChanges
CalendarBridgeClient::listChangedEvents(const std::string &syncToken) {
  CalendarChanges changes;
  if (m_cancelled) {
    changes.error = SyncError{SyncErrorKind::Cancelled, "listing cancelled"};
    return changes;
  }

  std::string path = eventsPath() + "?syncToken=" + urlEncode(syncToken);
  auto res = m_impl->client.Get(path.c_str());
  if (!res || res->status != 200) {
    int status = res ? res->status : -1;
    std::cerr << "[Calendar] Listing failed with status: " << status
              << std::endl;
    changes.error = transportError(status, "listing");
    return changes;
  }

  try {
    auto data = json::parse(res->body);
    for (const auto &item : data.at("events"))
      changes.events.push_back(fromJson(item));
    changes.syncToken = data.value("syncToken", syncToken);
    changes.hasMore = data.value("hasMore", false);
  } catch (const std::exception &e) {
    std::cerr << "[Calendar] JSON Parse Error: " << e.what() << std::endl;
    changes.events.clear();
    changes.error = SyncError{SyncErrorKind::Malformed, e.what()};
  }
  return changes;
}

CalendarWriteResult CalendarBridgeClient::writeResult(int status,
                                                      const std::string &body,
                                                      const std::string &what) {
  CalendarWriteResult result;
  if (status == 200 || status == 204)
    return result;
  if (status == 409) {
    result.conflict = true;
    result.current = eventFromJson(body);
    if (!result.current)
      result.error = SyncError{SyncErrorKind::Malformed,
                               what + ": unreadable conflict body"};
    return result;
  }
  std::cerr << "[Calendar] " << what << " failed with status: " << status
            << std::endl;
  result.error = transportError(status, what);
  return result;
}

CalendarWriteResult CalendarBridgeClient::upsertEvent(const CalendarEvent &event) {
  if (m_cancelled)
    return {SyncError{SyncErrorKind::Cancelled, "upsert cancelled"}, false,
            std::nullopt};
  std::string path = eventsPath() + "/" + urlEncode(event.uid);
  auto res = m_impl->client.Put(path.c_str(), eventToJson(event),
                                "application/json");
  return writeResult(res ? res->status : -1, res ? res->body : std::string(),
                     "upsert of " + event.uid);
}

CalendarWriteResult
CalendarBridgeClient::deleteEvent(const std::string &uid,
                                  const std::optional<CivilDate> &recurrenceId,
                                  int64_t sequence) {
  if (m_cancelled)
    return {SyncError{SyncErrorKind::Cancelled, "delete cancelled"}, false,
            std::nullopt};
  std::string path = eventsPath() + "/" + urlEncode(uid) +
                     "?sequence=" + std::to_string(sequence);
  if (recurrenceId)
    path += "&recurrenceId=" + civil::formatDate(*recurrenceId);
  auto res = m_impl->client.Delete(path.c_str());
  // Already gone counts as done.
  if (res && res->status == 404)
    return {};
  return writeResult(res ? res->status : -1, res ? res->body : std::string(),
                     "delete of " + uid);
}

} // namespace calsync
