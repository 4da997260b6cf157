#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace calsync {

// nlohmann::json ADL hooks. Instants travel as ISO-8601 UTC strings, rules as
// structured objects (the calendar bridge uses RRULE text instead).
void to_json(nlohmann::json &j, const CivilDate &d);
void from_json(const nlohmann::json &j, CivilDate &d);
void to_json(nlohmann::json &j, const RecurrenceRule &r);
void from_json(const nlohmann::json &j, RecurrenceRule &r);
void to_json(nlohmann::json &j, const RuleSegment &s);
void from_json(const nlohmann::json &j, RuleSegment &s);
void to_json(nlohmann::json &j, const SeriesPayload &p);
void from_json(const nlohmann::json &j, SeriesPayload &p);
void to_json(nlohmann::json &j, const OccurrenceException &e);
void from_json(const nlohmann::json &j, OccurrenceException &e);
void to_json(nlohmann::json &j, const SyncableRecord &r);
void from_json(const nlohmann::json &j, SyncableRecord &r);

std::string encodeSeries(const SeriesPayload &payload);
std::optional<SeriesPayload> decodeSeries(const std::string &payload);
std::string encodeException(const OccurrenceException &ex);
std::optional<OccurrenceException> decodeException(const std::string &payload);

Instant instantFromJson(const nlohmann::json &j);

} // namespace calsync
