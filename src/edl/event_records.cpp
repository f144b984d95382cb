// File: src/edl/event_records.cpp
#include "reel/edl/event_records.hpp"

#include <filesystem>

#include <yaml-cpp/yaml.h>

#include "reel/core/util/timecode.hpp"
#include "reel/edl/event_types.hpp"

namespace reel {
namespace {

template <typename T>
void read_field(const YAML::Node& n, const char* key, std::optional<T>& out,
                std::vector<std::string>& problems) {
  const YAML::Node v = n[key];
  if (!v || v.IsNull()) return;
  try {
    out = v.as<T>();
  } catch (const YAML::Exception&) {
    problems.push_back(std::string("unreadable field '") + key + "'");
  }
}

void read_abs_ts(const YAML::Node& n, EventRecord& r) {
  const YAML::Node v = n["abs_ts"];
  if (!v || v.IsNull()) return;
  if (!v.IsScalar()) {
    r.problems.push_back("abs_ts must be a number or a timestamp string");
    return;
  }
  double secs = 0.0;
  if (YAML::convert<double>::decode(v, secs)) {
    r.abs_ts = EventRecord::TimeField{secs};
  } else {
    r.abs_ts = EventRecord::TimeField{v.as<std::string>()};
  }
}

// {home: 2, away: 1}, [2, 1] or "2-1".
void read_score(const YAML::Node& n, EventRecord& r) {
  const YAML::Node v = n["score"];
  if (!v || v.IsNull()) return;
  try {
    if (v.IsMap() && v["home"] && v["away"]) {
      r.score = EventRecord::ScoreField{MatchScore{v["home"].as<int>(), v["away"].as<int>()}};
    } else if (v.IsSequence() && v.size() == 2) {
      r.score = EventRecord::ScoreField{MatchScore{v[0].as<int>(), v[1].as<int>()}};
    } else if (v.IsScalar()) {
      r.score = EventRecord::ScoreField{v.as<std::string>()};
    }
  } catch (const YAML::Exception&) {
    // A bad score never invalidates the event; it is simply not carried.
    r.score.reset();
  }
}

void read_signals(const YAML::Node& n, EventRecord& r) {
  const YAML::Node v = n["signals"];
  if (!v || v.IsNull()) return;
  try {
    if (v.IsSequence()) {
      for (const auto& s : v) r.signals.push_back(s.as<std::string>());
    } else if (v.IsScalar()) {
      r.signals.push_back(v.as<std::string>());
    }
  } catch (const YAML::Exception&) {
    r.problems.push_back("unreadable field 'signals'");
  }
}

EventRecord record_from_node(const YAML::Node& n) {
  EventRecord r;
  if (!n.IsMap()) {
    r.problems.push_back("event must be a map");
    return r;
  }

  std::optional<std::string> type;
  read_field(n, "type", type, r.problems);
  if (type) r.type = *type;

  std::optional<std::string> id;
  read_field(n, "id", id, r.problems);
  if (id) r.id = *id;

  read_abs_ts(n, r);
  read_field(n, "half", r.half, r.problems);
  read_field(n, "clock", r.clock, r.problems);
  read_field(n, "minute", r.minute, r.problems);
  read_field(n, "team", r.team, r.problems);
  read_field(n, "player", r.player, r.problems);
  read_field(n, "assist", r.assist, r.problems);
  read_score(n, r);
  read_field(n, "notes", r.notes, r.problems);
  read_field(n, "status", r.status, r.problems);
  read_field(n, "confidence", r.confidence, r.problems);
  read_signals(n, r);
  return r;
}

Result<std::vector<EventRecord>> records_from_root(const YAML::Node& root) {
  const YAML::Node list = root.IsMap() ? root["events"] : root;

  if (!list || list.IsNull()) return Result<std::vector<EventRecord>>::ok({});
  if (!list.IsSequence()) {
    return Result<std::vector<EventRecord>>::err(
        Status::invalid_argument("events must be a list (or a map with an 'events' list)"));
  }

  std::vector<EventRecord> out;
  out.reserve(list.size());
  for (const auto& n : list) out.push_back(record_from_node(n));
  return Result<std::vector<EventRecord>>::ok(std::move(out));
}

}  // namespace

Result<std::vector<EventRecord>> parse_event_records(const std::string& text) {
  try {
    return records_from_root(YAML::Load(text));
  } catch (const YAML::Exception& e) {
    return Result<std::vector<EventRecord>>::err(
        Status::parse_error(std::string("events document: ") + e.what()));
  }
}

Result<std::vector<EventRecord>> load_event_records(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Result<std::vector<EventRecord>>::err(Status::not_found("events file not found: " + path));
  }
  try {
    return records_from_root(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    return Result<std::vector<EventRecord>>::err(
        Status::parse_error("events file " + path + ": " + e.what()));
  }
}

std::vector<std::string> validate_event_records(const std::vector<EventRecord>& records) {
  std::vector<std::string> errors;

  for (std::size_t i = 0; i < records.size(); ++i) {
    const EventRecord& r = records[i];
    const std::string where = "event " + std::to_string(i) + ": ";

    for (const auto& p : r.problems) errors.push_back(where + p);

    if (r.type.empty()) {
      errors.push_back(where + "missing required field: type");
    } else if (!is_guided_type(r.type)) {
      errors.push_back(where + "invalid event type: " + r.type);
    }

    if (!r.abs_ts && !(r.half && r.clock)) {
      if (!r.half) errors.push_back(where + "missing required field: half (or abs_ts)");
      if (!r.clock) errors.push_back(where + "missing required field: clock (or abs_ts)");
    }

    if (r.half && *r.half != 1 && *r.half != 2) {
      errors.push_back(where + "invalid half: " + std::to_string(*r.half));
    }
    if (r.clock && !parse_match_clock(*r.clock).ok()) {
      errors.push_back(where + "invalid clock format: " + *r.clock);
    }
    if (r.abs_ts) {
      if (const auto* text = std::get_if<std::string>(&*r.abs_ts)) {
        if (!parse_timestamp(*text).ok()) errors.push_back(where + "invalid abs_ts: " + *text);
      } else if (std::get<Seconds>(*r.abs_ts) < 0.0) {
        errors.push_back(where + "abs_ts must be >= 0");
      }
    }
    if (r.confidence && (*r.confidence < 0.0 || *r.confidence > 1.0)) {
      errors.push_back(where + "confidence must be in [0, 1]");
    }
  }
  return errors;
}

}  // namespace reel
