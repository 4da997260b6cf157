#pragma once
#include "DatabaseManager.hpp"
#include "NotificationService.hpp"
#include "types.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace calsync {

constexpr const char *kEventReminderChannel = "event-reminder";
constexpr const char *kTaskDueChannel = "task-due";
constexpr const char *kDailySummaryChannel = "daily-summary";
constexpr const char *kDailySummarySeries = "daily-summary";

struct ReminderSettings {
  std::vector<int64_t> eventOffsets{15 * 60};
  std::vector<int64_t> taskOffsets{0};
  bool dailySummary = false;
  int64_t dailySummarySecondsOfDay = 8 * 3600;
};

struct NotificationPlan {
  std::vector<ScheduledNotification> toSchedule;
  std::vector<ScheduledNotification> toCancel;
};

// "<occurrenceId>#<offsetSeconds>", the id handed to the service.
std::string notificationId(const std::string &occurrenceId,
                           int64_t offsetSeconds);

// One degenerate occurrence per day, "daily-summary@YYYY-MM-DD", starting at
// the configured time of day.
std::vector<Occurrence> dailySummaryOccurrences(Instant from, int32_t days,
                                                const ReminderSettings &settings);

/**
 * Diffs the notifications `current` calls for against `scheduled`.
 *
 * Desired pairs are (occurrence, offset) with trigger start - offset, minus
 * triggers already past at `now`. Pairs whose trigger moved are cancelled
 * and scheduled again; unchanged pairs appear in neither list. Every pair of
 * a cancelled occurrence or a completed task is cancelled.
 */
NotificationPlan reconcile(const std::vector<Occurrence> &current,
                           const std::vector<ScheduledNotification> &scheduled,
                           const ReminderSettings &settings, Instant now);

/**
 * Applies reconcile() plans to the notification service and remembers what
 * was scheduled in the Notification table. Refreshes are serialized.
 * A service failure never propagates: it is logged and raises degraded().
 */
class NotificationScheduler {
public:
  NotificationScheduler(DatabaseManager &db, NotificationService &service,
                        ReminderSettings settings = {},
                        Clock clock = systemNow);

  bool refresh(const std::vector<Occurrence> &current);
  // Re-issues remembered notifications the service lost, drops remembered
  // ones that already fired and cancels pending ones nobody remembers.
  void healOnStartup();

  void setSettings(const ReminderSettings &settings);
  ReminderSettings settings() const;

  size_t pendingCount();
  bool degraded() const { return m_degraded; }

private:
  DatabaseManager &m_db;
  NotificationService &m_service;
  ReminderSettings m_settings;
  Clock m_clock;
  mutable std::mutex m_mutex;
  std::atomic<bool> m_degraded{false};
};

} // namespace calsync
