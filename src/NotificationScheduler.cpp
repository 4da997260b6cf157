#include "NotificationScheduler.hpp"
#include "CivilTime.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>
#include <set>
#include <utility>

using json = nlohmann::json;

namespace calsync {

namespace {

using PairKey = std::pair<std::string, int64_t>;

const std::vector<int64_t> kSummaryOffsets{0};

std::string payloadFor(const ScheduledNotification &n) {
  json j{{"occurrenceId", n.occurrenceId},
         {"offset", n.offsetSeconds},
         {"trigger", civil::formatInstant(n.trigger)},
         {"channel", n.channel},
         {"title", n.title}};
  return j.dump();
}

} // namespace

std::string notificationId(const std::string &occurrenceId,
                           int64_t offsetSeconds) {
  return occurrenceId + "#" + std::to_string(offsetSeconds);
}

std::vector<Occurrence> dailySummaryOccurrences(Instant from, int32_t days,
                                                const ReminderSettings &settings) {
  std::vector<Occurrence> out;
  if (!settings.dailySummary)
    return out;
  CivilDate first = civil::dateOf(from);
  for (int32_t d = 0; d < days; ++d) {
    Occurrence occ;
    occ.originalDate = civil::addDays(first, d);
    occ.seriesId = kDailySummarySeries;
    occ.id = occ.seriesId + "@" + civil::formatDate(occ.originalDate);
    occ.sequence = d;
    occ.start = civil::atTime(occ.originalDate,
                              settings.dailySummarySecondsOfDay);
    occ.end = occ.start;
    occ.title = "Daily summary";
    out.push_back(occ);
  }
  return out;
}

NotificationPlan reconcile(const std::vector<Occurrence> &current,
                           const std::vector<ScheduledNotification> &scheduled,
                           const ReminderSettings &settings, Instant now) {
  std::map<PairKey, ScheduledNotification> desired;
  std::set<std::string> silenced;

  for (const auto &occ : current) {
    if (occ.status == OccurrenceStatus::Cancelled ||
        (occ.kind == ItemKind::Task && occ.completed)) {
      silenced.insert(occ.id);
      continue;
    }

    bool summary = occ.seriesId == kDailySummarySeries;
    const auto &offsets = summary ? kSummaryOffsets
                          : occ.kind == ItemKind::Task ? settings.taskOffsets
                                                       : settings.eventOffsets;
    const char *channel = summary ? kDailySummaryChannel
                          : occ.kind == ItemKind::Task ? kTaskDueChannel
                                                       : kEventReminderChannel;
    for (int64_t offset : offsets) {
      Instant trigger = occ.start - offset;
      if (trigger < now)
        continue;
      desired[{occ.id, offset}] =
          ScheduledNotification{occ.id, offset, trigger, channel, occ.title};
    }
  }

  NotificationPlan plan;
  for (const auto &existing : scheduled) {
    if (silenced.count(existing.occurrenceId)) {
      plan.toCancel.push_back(existing);
      continue;
    }
    auto it = desired.find({existing.occurrenceId, existing.offsetSeconds});
    if (it == desired.end()) {
      plan.toCancel.push_back(existing);
    } else if (it->second.trigger != existing.trigger) {
      plan.toCancel.push_back(existing);
    } else {
      desired.erase(it); // unchanged
    }
  }
  for (auto &entry : desired)
    plan.toSchedule.push_back(std::move(entry.second));
  // Nearest first, so a full notification center drops the far ones.
  std::stable_sort(plan.toSchedule.begin(), plan.toSchedule.end(),
                   [](const ScheduledNotification &a,
                      const ScheduledNotification &b) {
                     return a.trigger < b.trigger;
                   });
  return plan;
}

NotificationScheduler::NotificationScheduler(DatabaseManager &db,
                                             NotificationService &service,
                                             ReminderSettings settings,
                                             Clock clock)
    : m_db(db), m_service(service), m_settings(std::move(settings)),
      m_clock(std::move(clock)) {}

void NotificationScheduler::setSettings(const ReminderSettings &settings) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_settings = settings;
}

ReminderSettings NotificationScheduler::settings() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_settings;
}

bool NotificationScheduler::refresh(const std::vector<Occurrence> &current) {
  std::lock_guard<std::mutex> lock(m_mutex);
  bool clean = true;
  try {
    NotificationPlan plan =
        reconcile(current, m_db.getNotifications(), m_settings, m_clock());

    for (const auto &n : plan.toCancel) {
      if (!m_service.cancel(notificationId(n.occurrenceId, n.offsetSeconds))) {
        std::cerr << "[Notify] Could not cancel " << n.occurrenceId << " (-"
                  << n.offsetSeconds << "s)" << std::endl;
        clean = false;
      }
      if (!m_db.deleteNotification(n.occurrenceId, n.offsetSeconds))
        clean = false;
    }

    for (const auto &n : plan.toSchedule) {
      std::string id = notificationId(n.occurrenceId, n.offsetSeconds);
      if (!m_service.schedule(id, n.trigger, payloadFor(n))) {
        std::cerr << "[Notify] Could not schedule " << id << " at "
                  << civil::formatInstant(n.trigger) << std::endl;
        clean = false;
        continue;
      }
      if (!m_db.upsertNotification(n))
        clean = false;
    }

    if (!plan.toSchedule.empty() || !plan.toCancel.empty()) {
      std::cout << "[Notify] Scheduled " << plan.toSchedule.size()
                << ", cancelled " << plan.toCancel.size() << std::endl;
    }
  } catch (const std::exception &e) {
    std::cerr << "[Notify] Refresh failed: " << e.what() << std::endl;
    clean = false;
  }

  if (!clean && !m_degraded)
    std::cerr << "[Notify] Reminders degraded" << std::endl;
  m_degraded = !clean;
  return clean;
}

void NotificationScheduler::healOnStartup() {
  std::lock_guard<std::mutex> lock(m_mutex);
  try {
    std::set<std::string> pending;
    for (const auto &id : m_service.listPending())
      pending.insert(id);

    Instant now = m_clock();
    std::set<std::string> remembered;
    int32_t reissued = 0;
    for (const auto &n : m_db.getNotifications()) {
      std::string id = notificationId(n.occurrenceId, n.offsetSeconds);
      remembered.insert(id);
      if (pending.count(id))
        continue;
      if (n.trigger < now) {
        if (!m_db.deleteNotification(n.occurrenceId, n.offsetSeconds))
          m_degraded = true;
        continue;
      }
      if (m_service.schedule(id, n.trigger, payloadFor(n))) {
        ++reissued;
      } else {
        std::cerr << "[Notify] Could not re-issue " << id << std::endl;
        m_degraded = true;
      }
    }

    int32_t orphans = 0;
    for (const auto &id : pending) {
      if (remembered.count(id))
        continue;
      if (m_service.cancel(id))
        ++orphans;
      else
        std::cerr << "[Notify] Could not cancel orphan " << id << std::endl;
    }
    std::cout << "[Notify] Startup heal: " << reissued << " re-issued, "
              << orphans << " orphan(s) cancelled" << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "[Notify] Startup heal failed: " << e.what() << std::endl;
    m_degraded = true;
  }
}

size_t NotificationScheduler::pendingCount() {
  std::lock_guard<std::mutex> lock(m_mutex);
  Instant now = m_clock();
  size_t count = 0;
  for (const auto &n : m_db.getNotifications()) {
    if (n.trigger >= now)
      ++count;
  }
  return count;
}

} // namespace calsync
