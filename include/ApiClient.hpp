#pragma once

#include "SyncTarget.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace calsync {

struct ApiSettings {
  std::string baseUrl = "http://localhost:3000";
  std::string user;
  int connectTimeoutSeconds = 10;
  int readTimeoutSeconds = 30;
  int writeTimeoutSeconds = 30;
  int pullLimit = 200;
};

/**
 * ApiClient talks to the multi-device sync backend.
 * Uses cpp-httplib for networking and nlohmann/json for serialization.
 *
 *   GET  /sync/changes?user=&cursor=&limit=  -> {changes, cursor, hasMore}
 *   POST /sync/push {user, changes:[{changeId, op, idempotencyKey, record}]}
 *        -> {results:[{changeId, status: ack|conflict|error, record, message}]}
 *
 * 401/403 flips the client to AuthorizationState::Denied until resume().
 */
class ApiClient : public SyncTarget {
public:
  explicit ApiClient(const ApiSettings &settings);
  ~ApiClient() override;

  Origin origin() const override { return Origin::RemoteBackend; }
  std::string name() const override { return "remote"; }

  AuthorizationState authorize() override;
  PullResult pull(const std::string &cursor) override;
  PushResponse push(const std::vector<PendingChange> &batch) override;

  void cancel() override;
  void resume() override;

  // sha256(recordId ":" version ":" op), lets the backend drop re-deliveries.
  static std::string idempotencyKey(const PendingChange &change);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  ApiSettings m_settings;
  std::atomic<bool> m_cancelled{false};
  std::atomic<bool> m_denied{false};

  SyncError transportError(int status, const std::string &what);
};

std::string urlEncode(const std::string &value);

} // namespace calsync
