#include "ApiClient.hpp"
#include "Serialization.hpp"
#include "httplib.h"
#include "picosha2.h"
#include <cctype>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace calsync {

// Helper for URL encoding
std::string urlEncode(const std::string &value) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (auto i = value.begin(), n = value.end(); i != n; ++i) {
    std::string::value_type c = (*i);
    // Keep alphanumeric and other safe characters
    if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~') {
      escaped << c;
      continue;
    }
    // Any other characters are percent-encoded
    escaped << std::uppercase;
    escaped << '%' << std::setw(2) << int((unsigned char)c);
    escaped << std::nouppercase;
  }

  return escaped.str();
}

struct ApiClient::Impl {
  httplib::Client client;
  Impl(const ApiSettings &s) : client(s.baseUrl) {
    client.set_connection_timeout(s.connectTimeoutSeconds, 0);
    client.set_read_timeout(s.readTimeoutSeconds, 0);
    client.set_write_timeout(s.writeTimeoutSeconds, 0);
    client.set_follow_location(true);
  }
};

ApiClient::ApiClient(const ApiSettings &settings)
    : m_impl(std::make_unique<Impl>(settings)), m_settings(settings) {}

ApiClient::~ApiClient() = default;

std::string ApiClient::idempotencyKey(const PendingChange &change) {
  std::string source = change.recordId + ":" +
                       std::to_string(change.snapshot.version) + ":" +
                       toString(change.op);
  return picosha2::hash256_hex_string(source);
}

AuthorizationState ApiClient::authorize() {
  return m_denied ? AuthorizationState::Denied : AuthorizationState::ReadWrite;
}

void ApiClient::cancel() {
  m_cancelled = true;
  m_impl->client.stop();
}

void ApiClient::resume() {
  m_cancelled = false;
  m_denied = false;
}

SyncError ApiClient::transportError(int status, const std::string &what) {
  if (m_cancelled)
    return {SyncErrorKind::Cancelled, what + " cancelled"};
  if (status == 401 || status == 403) {
    m_denied = true;
    return {SyncErrorKind::AuthorizationDenied,
            what + " rejected with status " + std::to_string(status)};
  }
  if (status < 0)
    return {SyncErrorKind::Transient, what + " failed: no response"};
  if (status >= 400 && status < 500 && status != 408 && status != 429)
    return {SyncErrorKind::Malformed,
            what + " rejected with status " + std::to_string(status)};
  return {SyncErrorKind::Transient,
          what + " failed with status " + std::to_string(status)};
}

PullResult ApiClient::pull(const std::string &cursor) {
  PullResult result;
  if (m_cancelled) {
    result.error = SyncError{SyncErrorKind::Cancelled, "pull cancelled"};
    return result;
  }

  std::string path = "/sync/changes?user=" + urlEncode(m_settings.user) +
                     "&cursor=" + urlEncode(cursor) +
                     "&limit=" + std::to_string(m_settings.pullLimit);
  auto res = m_impl->client.Get(path.c_str());

  if (!res || res->status != 200) {
    int status = res ? res->status : -1;
    std::cerr << "[API] Pull failed with status: " << status << std::endl;
    result.error = transportError(status, "pull");
    return result;
  }

  try {
    auto data = json::parse(res->body);
    for (const auto &item : data.at("changes")) {
      SyncableRecord record = item.get<SyncableRecord>();
      record.origin = Origin::RemoteBackend;
      result.changes.push_back(std::move(record));
    }
    result.newCursor = data.value("cursor", cursor);
    result.hasMore = data.value("hasMore", false);
  } catch (const std::exception &e) {
    std::cerr << "[API] JSON Parse Error: " << e.what() << std::endl;
    result.changes.clear();
    result.error = SyncError{SyncErrorKind::Malformed, e.what()};
  }
  return result;
}

PushResponse ApiClient::push(const std::vector<PendingChange> &batch) {
  PushResponse response;
  if (m_cancelled) {
    response.error = SyncError{SyncErrorKind::Cancelled, "push cancelled"};
    return response;
  }

  json body;
  body["user"] = m_settings.user;
  body["changes"] = json::array();
  for (const auto &change : batch) {
    json entry;
    entry["changeId"] = change.changeId;
    entry["op"] = toString(change.op);
    entry["idempotencyKey"] = idempotencyKey(change);
    entry["record"] = change.snapshot;
    body["changes"].push_back(entry);
  }

  auto res = m_impl->client.Post("/sync/push", body.dump(), "application/json");
  if (!res || res->status != 200) {
    int status = res ? res->status : -1;
    std::cerr << "[API] Push of " << batch.size()
              << " change(s) failed with status: " << status << std::endl;
    response.error = transportError(status, "push");
    return response;
  }

  try {
    auto data = json::parse(res->body);
    for (const auto &item : data.at("results")) {
      PushResult result;
      result.changeId = item.at("changeId").get<int64_t>();
      std::string status = item.value("status", "error");
      if (status == "ack") {
        result.outcome = PushOutcome::Ack;
      } else if (status == "conflict") {
        result.outcome = PushOutcome::Conflict;
        SyncableRecord current = item.at("record").get<SyncableRecord>();
        current.origin = Origin::RemoteBackend;
        result.current = current;
      } else {
        result.outcome = PushOutcome::Error;
      }
      result.message = item.value("message", "");
      response.results.push_back(std::move(result));
    }
  } catch (const std::exception &e) {
    std::cerr << "[API] JSON Parse Error: " << e.what() << std::endl;
    response.results.clear();
    response.error = SyncError{SyncErrorKind::Malformed, e.what()};
  }
  return response;
}

} // namespace calsync
