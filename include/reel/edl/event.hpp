// File: include/reel/edl/event.hpp
#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "reel/core/types.hpp"

namespace reel {

// A raw event record as it arrives: from a guided-events file, or exported from fusion.
// Every field is optional; the EDL decides what a usable record needs.
struct EventRecord {
  // Absolute time as seconds, or as written ("HH:MM:SS.fff").
  using TimeField = std::variant<Seconds, std::string>;
  // Score as a pair, or as written ("2-1").
  using ScoreField = std::variant<MatchScore, std::string>;

  std::string id;
  std::string type;

  std::optional<TimeField> abs_ts;
  std::optional<int> half;
  std::optional<std::string> clock;
  std::optional<int> minute;

  std::optional<std::string> team;
  std::optional<std::string> player;
  std::optional<std::string> assist;
  std::optional<ScoreField> score;
  std::optional<std::string> notes;
  std::optional<std::string> status;

  std::optional<double> confidence;
  std::vector<std::string> signals;

  // Fields present in the source that could not be read as their expected type.
  std::vector<std::string> problems;
};

// The EDL's working unit. Provenance is fixed at construction; conflict resolution swaps whole
// events rather than relabelling one.
class Event {
 public:
  explicit Event(EventSource source) : source_(source) {}

  [[nodiscard]] EventSource source() const noexcept { return source_; }
  [[nodiscard]] bool is_guided() const noexcept { return source_ == EventSource::kGuided; }

  // Total clip length around abs_ts.
  [[nodiscard]] Seconds duration() const noexcept { return pre_padding + post_padding; }

  [[nodiscard]] bool has_signal(const std::string& s) const {
    for (const auto& x : signals) {
      if (x == s) return true;
    }
    return false;
  }

  std::string id;
  std::string type;
  Seconds abs_ts = 0.0;

  // True when abs_ts came from half + clock + kickoff (recomputed if kickoff changes).
  bool abs_ts_from_clock = false;

  std::optional<int> half;
  std::optional<std::string> clock;
  std::optional<int> minute;  // match minute, when the record carried one
  std::optional<std::string> team;
  std::optional<std::string> player;
  std::optional<std::string> assist;
  std::optional<MatchScore> score;
  std::optional<std::string> notes;
  std::optional<MatchStatus> status;

  double confidence = 1.0;
  std::vector<std::string> signals;

  Seconds pre_padding = 0.0;
  Seconds post_padding = 0.0;
  bool zoom_enabled = false;
  bool replay_enabled = false;

 private:
  EventSource source_;
};

}  // namespace reel
