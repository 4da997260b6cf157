#include "Config.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace calsync {

namespace {

std::vector<int64_t> minutesToSeconds(const json &minutes) {
  std::vector<int64_t> seconds;
  for (const auto &m : minutes)
    seconds.push_back(m.get<int64_t>() * 60);
  return seconds;
}

int64_t parseTimeOfDay(const std::string &text) {
  int hours = 0, minutes = 0;
  char colon = 0;
  std::istringstream in(text);
  if (!(in >> hours >> colon >> minutes) || colon != ':' || hours < 0 ||
      hours > 23 || minutes < 0 || minutes > 59)
    throw std::runtime_error("bad time of day: " + text);
  return hours * 3600 + minutes * 60;
}

} // namespace

AppConfig parseConfig(const std::string &text) {
  AppConfig config;
  try {
    json j = json::parse(text);

    config.dbPath = j.value("database", config.dbPath);

    if (j.contains("remote")) {
      const auto &r = j.at("remote");
      config.remoteEnabled = r.value("enabled", config.remoteEnabled);
      config.remote.baseUrl = r.value("url", config.remote.baseUrl);
      config.remote.user = r.value("user", config.remote.user);
      config.remote.connectTimeoutSeconds =
          r.value("connectTimeout", config.remote.connectTimeoutSeconds);
      config.remote.readTimeoutSeconds =
          r.value("readTimeout", config.remote.readTimeoutSeconds);
      config.remote.writeTimeoutSeconds =
          r.value("writeTimeout", config.remote.writeTimeoutSeconds);
      config.remote.pullLimit = r.value("pullLimit", config.remote.pullLimit);
    }

    if (j.contains("calendar")) {
      const auto &c = j.at("calendar");
      config.calendarEnabled = c.value("enabled", config.calendarEnabled);
      config.calendar.baseUrl = c.value("url", config.calendar.baseUrl);
      config.calendar.calendarId =
          c.value("calendarId", config.calendar.calendarId);
      config.calendar.connectTimeoutSeconds =
          c.value("connectTimeout", config.calendar.connectTimeoutSeconds);
      config.calendar.readTimeoutSeconds =
          c.value("readTimeout", config.calendar.readTimeoutSeconds);
    }

    if (j.contains("sync")) {
      const auto &s = j.at("sync");
      config.sync.intervalSeconds =
          s.value("interval", config.sync.intervalSeconds);
      config.sync.batchSize = s.value("batchSize", config.sync.batchSize);
      config.sync.networkAttempts =
          s.value("networkAttempts", config.sync.networkAttempts);
      config.journal.maxRetries =
          s.value("maxRetries", config.journal.maxRetries);
      config.journal.backoffBaseSeconds =
          s.value("backoffBase", config.journal.backoffBaseSeconds);
      config.journal.backoffMaxSeconds =
          s.value("backoffMax", config.journal.backoffMaxSeconds);
      if (s.contains("policy")) {
        auto policy =
            conflictPolicyFromString(s.at("policy").get<std::string>());
        if (!policy)
          throw std::runtime_error("unknown conflict policy " +
                                   s.at("policy").dump());
        config.policy = *policy;
      }
    }

    if (j.contains("reminders")) {
      const auto &r = j.at("reminders");
      if (r.contains("eventOffsetsMinutes"))
        config.reminders.eventOffsets =
            minutesToSeconds(r.at("eventOffsetsMinutes"));
      if (r.contains("taskOffsetsMinutes"))
        config.reminders.taskOffsets =
            minutesToSeconds(r.at("taskOffsetsMinutes"));
      config.reminders.dailySummary =
          r.value("dailySummary", config.reminders.dailySummary);
      if (r.contains("dailySummaryTime"))
        config.reminders.dailySummarySecondsOfDay =
            parseTimeOfDay(r.at("dailySummaryTime").get<std::string>());
      config.notificationQuota = r.value("quota", config.notificationQuota);
    }

    config.horizonDays = j.value("horizonDays", config.horizonDays);
    config.refreshIntervalSeconds =
        j.value("refreshInterval", config.refreshIntervalSeconds);
  } catch (const json::exception &e) {
    throw std::runtime_error(std::string("invalid config: ") + e.what());
  }

  if (config.horizonDays <= 0 || config.sync.batchSize == 0)
    throw std::runtime_error("invalid config: horizonDays and batchSize must "
                             "be positive");
  if (config.refreshIntervalSeconds <= 0 ||
      config.refreshIntervalSeconds > 86400)
    throw std::runtime_error("invalid config: refreshInterval must be within "
                             "1..86400 seconds");
  return config;
}

AppConfig loadConfig(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    std::cout << "[Config] " << path << " not found, using defaults"
              << std::endl;
    return AppConfig{};
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  std::cout << "[Config] Loaded " << path << std::endl;
  return parseConfig(buffer.str());
}

} // namespace calsync
