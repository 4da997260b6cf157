#include "LocalNotificationService.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace calsync {

struct PendingNotification {
  Instant trigger;
  std::string payload;
};

struct LocalNotificationService::Impl {
  std::map<std::string, PendingNotification> pending;
  mutable std::mutex mtx;
  std::thread workerThread;
  std::atomic<bool> workerRunning{false};
  std::atomic<size_t> delivered{0};
  size_t quota;
  DeliveryCallback callback;
  Clock clock;

  std::chrono::milliseconds pollInterval{250};

  Impl(size_t q, DeliveryCallback cb, Clock c)
      : quota(q), callback(std::move(cb)), clock(std::move(c)) {}

  void workerLoop() {
    while (workerRunning) {
      std::this_thread::sleep_for(pollInterval);

      std::vector<std::pair<std::string, std::string>> due;
      {
        std::lock_guard<std::mutex> lock(mtx);
        Instant now = clock();
        for (auto it = pending.begin(); it != pending.end();) {
          if (it->second.trigger > now) {
            ++it;
            continue;
          }
          due.emplace_back(it->first, it->second.payload);
          it = pending.erase(it);
        }
      }

      // Deliver outside the lock; the callback may schedule again.
      for (const auto &entry : due) {
        std::cout << "[Notify] Delivering " << entry.first << std::endl;
        if (callback)
          callback(entry.first, entry.second);
        ++delivered;
      }
    }
  }
};

LocalNotificationService::LocalNotificationService(size_t quota,
                                                   DeliveryCallback callback,
                                                   Clock clock)
    : m_impl(std::make_unique<Impl>(quota, std::move(callback),
                                    std::move(clock))) {}

LocalNotificationService::~LocalNotificationService() { stop(); }

void LocalNotificationService::start() {
  if (m_impl->workerRunning)
    return;
  m_impl->workerRunning = true;
  m_impl->workerThread = std::thread(&Impl::workerLoop, m_impl.get());
}

void LocalNotificationService::stop() {
  m_impl->workerRunning = false;
  if (m_impl->workerThread.joinable())
    m_impl->workerThread.join();
}

bool LocalNotificationService::schedule(const std::string &id, Instant trigger,
                                        const std::string &payload) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  auto existing = m_impl->pending.find(id);
  if (existing == m_impl->pending.end() &&
      m_impl->pending.size() >= m_impl->quota) {
    std::cerr << "[Notify] Quota of " << m_impl->quota
              << " pending notifications reached, dropping " << id
              << std::endl;
    return false;
  }
  m_impl->pending[id] = PendingNotification{trigger, payload};
  return true;
}

bool LocalNotificationService::cancel(const std::string &id) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  m_impl->pending.erase(id);
  return true;
}

std::vector<std::string> LocalNotificationService::listPending() {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  std::vector<std::string> ids;
  ids.reserve(m_impl->pending.size());
  for (const auto &entry : m_impl->pending)
    ids.push_back(entry.first);
  return ids;
}

size_t LocalNotificationService::deliveredCount() const {
  return m_impl->delivered;
}

} // namespace calsync
