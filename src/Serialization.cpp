#include "Serialization.hpp"
#include "CivilTime.hpp"
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace calsync {

namespace {

const char *frequencyName(Frequency f) {
  switch (f) {
  case Frequency::Daily:
    return "daily";
  case Frequency::Weekly:
    return "weekly";
  case Frequency::Monthly:
    return "monthly";
  case Frequency::Yearly:
    return "yearly";
  case Frequency::Custom:
    return "custom";
  }
  return "daily";
}

Frequency frequencyFromName(const std::string &name) {
  if (name == "daily")
    return Frequency::Daily;
  if (name == "weekly")
    return Frequency::Weekly;
  if (name == "monthly")
    return Frequency::Monthly;
  if (name == "yearly")
    return Frequency::Yearly;
  if (name == "custom")
    return Frequency::Custom;
  throw std::invalid_argument("unknown frequency: " + name);
}

json instantToJson(Instant t) { return civil::formatInstant(t); }

} // namespace

Instant instantFromJson(const json &j) {
  if (j.is_number_integer())
    return j.get<Instant>();
  auto parsed = civil::parseInstant(j.get<std::string>());
  if (!parsed)
    throw std::invalid_argument("bad instant: " + j.dump());
  return *parsed;
}

void to_json(json &j, const CivilDate &d) { j = civil::formatDate(d); }

void from_json(const json &j, CivilDate &d) {
  auto parsed = civil::parseDate(j.get<std::string>());
  if (!parsed)
    throw std::invalid_argument("bad date: " + j.dump());
  d = *parsed;
}

void to_json(json &j, const RecurrenceRule &r) {
  j = json{{"frequency", frequencyName(r.frequency)}, {"interval", r.interval}};
  switch (r.termination) {
  case Termination::None:
    j["termination"] = "none";
    break;
  case Termination::EndDate:
    j["termination"] = "end-date";
    if (r.until)
      j["until"] = instantToJson(*r.until);
    break;
  case Termination::Count:
    j["termination"] = "count";
    if (r.count)
      j["count"] = *r.count;
    break;
  }
  if (!r.weekdays.empty()) {
    json days = json::array();
    for (Weekday wd : r.weekdays)
      days.push_back(static_cast<int>(wd));
    j["weekdays"] = days;
  }
  if (!r.monthDays.empty())
    j["monthDays"] = r.monthDays;
}

void from_json(const json &j, RecurrenceRule &r) {
  r = RecurrenceRule{};
  r.frequency = frequencyFromName(j.at("frequency").get<std::string>());
  r.interval = j.value("interval", 1);
  const std::string termination = j.value("termination", "none");
  if (termination == "end-date") {
    r.termination = Termination::EndDate;
    if (j.contains("until"))
      r.until = instantFromJson(j.at("until"));
  } else if (termination == "count") {
    r.termination = Termination::Count;
    if (j.contains("count"))
      r.count = j.at("count").get<int32_t>();
  }
  if (j.contains("weekdays")) {
    for (const auto &wd : j.at("weekdays")) {
      int idx = wd.get<int>();
      if (idx < 0 || idx > 6)
        throw std::invalid_argument("bad weekday index");
      r.weekdays.push_back(static_cast<Weekday>(idx));
    }
  }
  if (j.contains("monthDays"))
    r.monthDays = j.at("monthDays").get<std::vector<int32_t>>();
}

void to_json(json &j, const RuleSegment &s) {
  j = json{{"rule", s.rule},
           {"anchor", instantToJson(s.anchor)},
           {"duration", s.durationSeconds}};
  if (s.effectiveUntil)
    j["effectiveUntil"] = instantToJson(*s.effectiveUntil);
}

void from_json(const json &j, RuleSegment &s) {
  s.rule = j.at("rule").get<RecurrenceRule>();
  s.anchor = instantFromJson(j.at("anchor"));
  s.durationSeconds = j.value("duration", int64_t{0});
  s.effectiveUntil.reset();
  if (j.contains("effectiveUntil") && !j.at("effectiveUntil").is_null())
    s.effectiveUntil = instantFromJson(j.at("effectiveUntil"));
}

void to_json(json &j, const SeriesPayload &p) {
  j = json{{"kind", p.kind == ItemKind::Task ? "task" : "event"},
           {"title", p.title},
           {"notes", p.notes},
           {"category", p.category},
           {"recurring", p.recurring},
           {"segments", p.segments}};
}

void from_json(const json &j, SeriesPayload &p) {
  p.kind = j.value("kind", "event") == "task" ? ItemKind::Task : ItemKind::Event;
  p.title = j.value("title", "");
  p.notes = j.value("notes", "");
  p.category = j.value("category", "");
  p.recurring = j.value("recurring", true);
  p.segments = j.at("segments").get<std::vector<RuleSegment>>();
  if (p.segments.empty())
    throw std::invalid_argument("series without rule segments");
}

void to_json(json &j, const OccurrenceException &e) {
  j = json{{"seriesId", e.seriesId},
           {"originalDate", e.originalDate},
           {"kind", e.kind == ExceptionKind::Cancel ? "cancel" : "replace"},
           {"start", instantToJson(e.start)},
           {"end", instantToJson(e.end)},
           {"completed", e.completed}};
  if (e.title)
    j["title"] = *e.title;
}

void from_json(const json &j, OccurrenceException &e) {
  e.seriesId = j.at("seriesId").get<std::string>();
  e.originalDate = j.at("originalDate").get<CivilDate>();
  e.kind = j.value("kind", "replace") == "cancel" ? ExceptionKind::Cancel
                                                   : ExceptionKind::Replace;
  e.start = instantFromJson(j.at("start"));
  e.end = instantFromJson(j.at("end"));
  e.completed = j.value("completed", false);
  e.title.reset();
  if (j.contains("title") && !j.at("title").is_null())
    e.title = j.at("title").get<std::string>();
}

void to_json(json &j, const SyncableRecord &r) {
  j = json{{"id", r.id},
           {"type", toString(r.type)},
           {"origin", toString(r.origin)},
           {"version", r.version},
           {"lastModified", instantToJson(r.lastModified)},
           {"deleted", r.deleted}};
  if (!r.payload.empty())
    j["payload"] = json::parse(r.payload);
}

void from_json(const json &j, SyncableRecord &r) {
  r.id = j.at("id").get<std::string>();
  auto type = recordTypeFromString(j.value("type", "series"));
  if (!type)
    throw std::invalid_argument("unknown record type");
  r.type = *type;
  r.origin = originFromString(j.value("origin", "remote-backend"))
                 .value_or(Origin::RemoteBackend);
  r.version = j.at("version").get<int64_t>();
  r.lastModified = instantFromJson(j.at("lastModified"));
  r.deleted = j.value("deleted", false);
  r.payload.clear();
  if (j.contains("payload") && !j.at("payload").is_null())
    r.payload = j.at("payload").dump();
}

std::string encodeSeries(const SeriesPayload &payload) {
  return json(payload).dump();
}

std::optional<SeriesPayload> decodeSeries(const std::string &payload) {
  try {
    return json::parse(payload).get<SeriesPayload>();
  } catch (const std::exception &e) {
    std::cerr << "[Serialization] Bad series payload: " << e.what()
              << std::endl;
    return std::nullopt;
  }
}

std::string encodeException(const OccurrenceException &ex) {
  return json(ex).dump();
}

std::optional<OccurrenceException>
decodeException(const std::string &payload) {
  try {
    return json::parse(payload).get<OccurrenceException>();
  } catch (const std::exception &e) {
    std::cerr << "[Serialization] Bad exception payload: " << e.what()
              << std::endl;
    return std::nullopt;
  }
}

} // namespace calsync
