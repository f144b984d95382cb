// File: include/reel/edl/event_records.hpp
#pragma once

#include <string>
#include <vector>

#include "reel/core/status.hpp"
#include "reel/edl/event.hpp"

namespace reel {

// Guided-events document: JSON or YAML, either a list of records or a map with an `events` list.
// Fields that are present but unreadable are recorded in EventRecord::problems (schema
// validation reports them); the document itself only fails on syntax or shape.
Result<std::vector<EventRecord>> parse_event_records(const std::string& text);
Result<std::vector<EventRecord>> load_event_records(const std::string& path);

// Whole-list schema check. Returns every problem found ("event 3: missing clock"), empty if valid.
//   - type: required, non-empty, one of the guided types
//   - abs_ts, or both half and clock
//   - half in {1, 2}; clock parses as a match clock; abs_ts parses as a timestamp
//   - confidence in [0, 1]
std::vector<std::string> validate_event_records(const std::vector<EventRecord>& records);

}  // namespace reel
