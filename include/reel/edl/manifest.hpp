// File: include/reel/edl/manifest.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "reel/core/types.hpp"
#include "reel/edl/event.hpp"

namespace reel {

// One EDL entry as handed to rendering / export.
// Keep output stable; evolve by adding fields (not breaking existing ones).
struct ManifestEntry {
  std::string id;
  std::string type;
  std::string timestamp;  // "HH:MM:SS.mmm"
  Seconds abs_ts = 0.0;

  Seconds clip_start = 0.0;  // abs_ts - pre_padding, floored at 0
  Seconds clip_end = 0.0;    // abs_ts + post_padding
  Seconds duration = 0.0;    // pre_padding + post_padding
  std::optional<int> minute;

  std::optional<std::string> team;
  std::optional<std::string> player;
  std::optional<std::string> assist;
  std::optional<MatchScore> score;
  std::optional<std::string> notes;

  double confidence = 0.0;
  EventSource source = EventSource::kGuided;
  bool zoom_enabled = false;
  bool replay_enabled = false;
  std::vector<std::string> signals;
};

std::vector<ManifestEntry> export_manifest(const std::vector<Event>& events);

// Human-readable warnings for events or clips that fall outside [0, video_duration].
std::vector<std::string> validate_timing_consistency(const std::vector<Event>& events,
                                                     Seconds video_duration);

}  // namespace reel
