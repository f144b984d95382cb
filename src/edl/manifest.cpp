// File: src/edl/manifest.cpp
#include "reel/edl/manifest.hpp"

#include <algorithm>
#include <cstdio>

#include "reel/core/util/timecode.hpp"

namespace reel {
namespace {

std::string num(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", v);
  return buf;
}

}  // namespace

std::vector<ManifestEntry> export_manifest(const std::vector<Event>& events) {
  std::vector<ManifestEntry> out;
  out.reserve(events.size());

  for (const auto& e : events) {
    ManifestEntry m;
    m.id = e.id;
    m.type = e.type;
    m.timestamp = seconds_to_timestamp(e.abs_ts);
    m.abs_ts = e.abs_ts;
    m.clip_start = std::max(0.0, e.abs_ts - e.pre_padding);
    m.clip_end = e.abs_ts + e.post_padding;
    m.duration = e.duration();
    m.minute = e.minute;
    m.team = e.team;
    m.player = e.player;
    m.assist = e.assist;
    m.score = e.score;
    m.notes = e.notes;
    m.confidence = e.confidence;
    m.source = e.source();
    m.zoom_enabled = e.zoom_enabled;
    m.replay_enabled = e.replay_enabled;
    m.signals = e.signals;
    out.push_back(std::move(m));
  }
  return out;
}

std::vector<std::string> validate_timing_consistency(const std::vector<Event>& events,
                                                     Seconds video_duration) {
  std::vector<std::string> warnings;

  for (const auto& e : events) {
    if (e.abs_ts < 0.0) {
      warnings.push_back("Event " + e.type + " has negative timestamp: " + num(e.abs_ts));
    }
    if (e.abs_ts > video_duration) {
      warnings.push_back("Event " + e.type + " exceeds video duration: " + num(e.abs_ts) + " > " +
                         num(video_duration));
    }

    const double clip_start = e.abs_ts - e.pre_padding;
    const double clip_end = e.abs_ts + e.post_padding;
    if (clip_start < 0.0) {
      warnings.push_back("Event " + e.type + " clip starts before video: " + num(clip_start));
    }
    if (clip_end > video_duration) {
      warnings.push_back("Event " + e.type + " clip ends after video: " + num(clip_end));
    }
  }
  return warnings;
}

}  // namespace reel
