#include "ApiClient.hpp"
#include "CalendarBridgeClient.hpp"
#include "CalendarEngine.hpp"
#include "ChangeJournal.hpp"
#include "Config.hpp"
#include "DatabaseManager.hpp"
#include "ExternalCalendarTarget.hpp"
#include "LocalNotificationService.hpp"
#include "NotificationScheduler.hpp"
#include "SyncCoordinator.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static volatile std::sig_atomic_t shutdownSignal = 0;

static void signalHandler(int sig) { shutdownSignal = sig; }

int main(int argc, char **argv) {
  // register shutdown signals
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  const std::string configPath = argc > 1 ? argv[1] : "calsync.json";
  std::cout << "calsyncd starting..." << std::endl;

  try {
    calsync::AppConfig config = calsync::loadConfig(configPath);

    // 1. Local store
    calsync::DatabaseManager dbManager(config.dbPath);
    if (!dbManager.open()) {
      std::cerr << "[Main] Failed to open database." << std::endl;
      return 1;
    }
    dbManager.initializeSchema();
    std::cout << "[Main] Database initialized." << std::endl;

    // 2. Reminders
    calsync::LocalNotificationService notificationService(
        config.notificationQuota,
        [](const std::string &id, const std::string &payload) {
          std::cout << "[Reminder] " << id << " " << payload << std::endl;
        });
    calsync::NotificationScheduler scheduler(dbManager, notificationService,
                                             config.reminders);
    scheduler.healOnStartup();
    notificationService.start();

    // 3. Engine and sync targets
    calsync::ChangeJournal journal(dbManager, config.journal);
    calsync::EngineSettings engineSettings;
    engineSettings.horizonDays = config.horizonDays;
    engineSettings.policy = config.policy;
    calsync::CalendarEngine engine(dbManager, journal, scheduler,
                                   engineSettings);

    std::unique_ptr<calsync::ApiClient> apiClient;
    std::unique_ptr<calsync::SyncCoordinator> remoteSync;
    if (config.remoteEnabled) {
      apiClient = std::make_unique<calsync::ApiClient>(config.remote);
      remoteSync = std::make_unique<calsync::SyncCoordinator>(
          dbManager, journal, *apiClient, config.sync);
      engine.attach(*remoteSync);
      std::cout << "[Main] Remote backend: " << config.remote.baseUrl
                << std::endl;
    }

    std::unique_ptr<calsync::CalendarBridgeClient> bridge;
    std::unique_ptr<calsync::ExternalCalendarTarget> calendarTarget;
    std::unique_ptr<calsync::SyncCoordinator> calendarSync;
    if (config.calendarEnabled) {
      bridge = std::make_unique<calsync::CalendarBridgeClient>(config.calendar);
      calendarTarget = std::make_unique<calsync::ExternalCalendarTarget>(*bridge);
      calendarSync = std::make_unique<calsync::SyncCoordinator>(
          dbManager, journal, *calendarTarget, config.sync);
      engine.attach(*calendarSync);
      std::cout << "[Main] Calendar bridge: " << config.calendar.baseUrl
                << std::endl;
    }

    if (!engine.refresh())
      std::cerr << "[Main] Initial refresh incomplete, reminders may lag."
                << std::endl;
    size_t purged = engine.purgeConfirmedDeletions();
    std::cout << "[Main] " << engine.pendingNotificationCount()
              << " reminder(s) pending, " << purged
              << " deleted record(s) purged." << std::endl;

    if (remoteSync)
      remoteSync->start();
    if (calendarSync)
      calendarSync->start();

    std::cout << "[Main] Running. Press Ctrl+C to exit gracefully."
              << std::endl;
    const std::chrono::seconds refreshInterval(config.refreshIntervalSeconds);
    auto lastRefresh = std::chrono::steady_clock::now();
    while (shutdownSignal == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      if (std::chrono::steady_clock::now() - lastRefresh < refreshInterval)
        continue;
      lastRefresh = std::chrono::steady_clock::now();
      if (!engine.refresh())
        std::cerr << "[Main] Periodic refresh incomplete, retrying in "
                  << refreshInterval.count() << "s" << std::endl;
      engine.purgeConfirmedDeletions();
    }
    std::cout << "[Main] Shutdown signal received (" << shutdownSignal << ")"
              << std::endl;

    if (calendarSync)
      calendarSync->stop();
    if (remoteSync)
      remoteSync->stop();
    notificationService.stop();
    dbManager.close();
    std::cout << "[Main] Finished." << std::endl;

  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
