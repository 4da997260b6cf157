#pragma once
#include "NotificationService.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace calsync {

/**
 * In-process notification center used by calsyncd. Holds at most `quota`
 * pending notifications and fires due ones from a worker thread.
 */
class LocalNotificationService : public NotificationService {
public:
  using DeliveryCallback =
      std::function<void(const std::string &id, const std::string &payload)>;

  explicit LocalNotificationService(size_t quota = 64,
                                    DeliveryCallback callback = {},
                                    Clock clock = systemNow);
  ~LocalNotificationService() override;

  void start();
  void stop();

  bool schedule(const std::string &id, Instant trigger,
                const std::string &payload) override;
  bool cancel(const std::string &id) override;
  std::vector<std::string> listPending() override;

  size_t deliveredCount() const;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace calsync
