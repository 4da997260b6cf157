#pragma once
#include "ApiClient.hpp"
#include "CalendarBridgeClient.hpp"
#include "ChangeJournal.hpp"
#include "NotificationScheduler.hpp"
#include "SyncCoordinator.hpp"
#include "types.hpp"
#include <string>

namespace calsync {

struct AppConfig {
  std::string dbPath = "calsync.db";

  bool remoteEnabled = true;
  ApiSettings remote;
  bool calendarEnabled = false;
  CalendarBridgeSettings calendar;

  SyncSettings sync;
  JournalSettings journal;
  ConflictPolicy policy = ConflictPolicy::NewerWins;

  ReminderSettings reminders;
  int32_t horizonDays = 60;
  size_t notificationQuota = 64;
  // How often the daemon re-materializes occurrences and reminders on its
  // own, so the horizon and daily summaries keep moving while idle.
  int64_t refreshIntervalSeconds = 3600;
};

/**
 * Reads a JSON config file. Keys that are absent keep their defaults and a
 * missing file yields the defaults. Throws std::runtime_error for a file
 * that exists but cannot be parsed or holds values of the wrong type.
 *
 *   {
 *     "database": "calsync.db",
 *     "remote":   {"enabled": true, "url": "...", "user": "...",
 *                  "connectTimeout": 10, "readTimeout": 30},
 *     "calendar": {"enabled": false, "url": "...", "calendarId": "calsync"},
 *     "sync":     {"interval": 300, "batchSize": 50, "maxRetries": 5,
 *                  "backoffBase": 30, "backoffMax": 3600,
 *                  "policy": "newer-wins"},
 *     "reminders": {"eventOffsetsMinutes": [15], "taskOffsetsMinutes": [0],
 *                   "dailySummary": false, "dailySummaryTime": "08:00",
 *                   "quota": 64},
 *     "horizonDays": 60,
 *     "refreshInterval": 3600
 *   }
 */
AppConfig loadConfig(const std::string &path);
AppConfig parseConfig(const std::string &text);

} // namespace calsync
