// File: include/reel/core/types.hpp
#pragma once

#include <optional>
#include <string>

namespace reel {

// -----------------------------
// Time
// -----------------------------
// All timeline positions are seconds from the start of the recorded video (double).
// Match-clock values ("mm:ss") are only ever an input format; see util/timecode.hpp.

using Seconds = double;

// -----------------------------
// Event provenance
// -----------------------------

enum class EventSource {
  kGuided,  // human-curated / ground truth
  kAuto,    // derived from detector signals
};

inline const char* to_string(EventSource s) {
  return s == EventSource::kGuided ? "guided" : "auto";
}

// Match-state markers carried by guided records ("HT" / "FT").
enum class MatchStatus {
  kHalfTime,
  kFullTime,
};

inline const char* to_string(MatchStatus s) {
  return s == MatchStatus::kHalfTime ? "HT" : "FT";
}

inline std::optional<MatchStatus> parse_match_status(const std::string& s) {
  if (s == "HT") return MatchStatus::kHalfTime;
  if (s == "FT") return MatchStatus::kFullTime;
  return std::nullopt;
}

struct MatchScore {
  int home = 0;
  int away = 0;

  constexpr bool operator==(const MatchScore& other) const noexcept {
    return home == other.home && away == other.away;
  }
  constexpr bool operator!=(const MatchScore& other) const noexcept { return !(*this == other); }
};

}  // namespace reel
