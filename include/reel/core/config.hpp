// File: include/reel/core/config.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "reel/core/status.hpp"
#include "reel/core/types.hpp"

namespace reel {

// Units policy:
// - Timeline positions and durations in seconds (double)
// - Confidences in [0, 1]
// - Signal weights are unitless multipliers

// Default per-signal weights. Ground truth >> vision >> audio ~ commentary > flow > scene cut.
inline std::map<std::string, double> default_signal_weights() {
  return {
      {"json", 5.0},
      {"yolo", 2.0},
      {"audio", 1.5},
      {"whistle", 1.0},
      {"flow", 1.0},
      {"scene_cut", 0.5},
      {"commentary", 1.2},
  };
}

// Weight applied to signal types missing from the table.
constexpr double kUnlistedSignalWeight = 1.0;

// An auto event replaces a conflicting guided one only with at least this much more confidence.
constexpr double kDefaultPromotionMargin = 0.15;

// -----------------------------
// Detection / fusion
// -----------------------------
struct DetectionConfig {
  std::map<std::string, double> weights = default_signal_weights();

  // Fusion bucket width.
  double bucket_size = 1.0;

  // Fused events scoring below this are dropped.
  double min_confidence = 0.3;

  // Fold fused events closer than this after ranking (0 disables).
  double merge_window_s = 0.0;

  // Keep only the best K fused events (0 keeps all).
  int top_k = 0;

  // Guided/auto conflict window (exclusive).
  double dedupe_window_s = 4.0;

  double promotion_margin = kDefaultPromotionMargin;

  [[nodiscard]] double weight_for(const std::string& signal_type) const {
    const auto it = weights.find(signal_type);
    return it == weights.end() ? kUnlistedSignalWeight : it->second;
  }
};

// -----------------------------
// Output budget / clip length
// -----------------------------
struct LimitsConfig {
  int max_clips = 20;
  double min_clip_len_s = 6.0;
  double max_clip_len_s = 30.0;
};

// -----------------------------
// Adaptive padding
// -----------------------------
struct PaddingWindow {
  double pre = 7.0;
  double post = 10.0;
};

// Per-type override. Unset fields keep the default window's value.
struct PaddingOverride {
  std::optional<double> pre;
  std::optional<double> post;
};

struct PaddingConfig {
  PaddingWindow default_window;

  PaddingOverride save;          // save, big_save
  PaddingOverride chance;
  PaddingOverride foul_or_card;  // foul, card

  // Goal bonuses, driven by the event's signal tags.
  double goal_pre_bonus_on_attack = 0.0;        // "build_up" or "attack"
  double goal_post_bonus_on_celebration = 0.0;  // "celebration"

  double max_pre = 15.0;
  double max_post = 25.0;
};

// -----------------------------
// Feature flags
// -----------------------------
struct ZoomConfig {
  bool enable = true;
};

struct ReplayConfig {
  std::vector<std::string> enable_for;
};

// -----------------------------
// Match timing reference
// -----------------------------
struct MatchConfig {
  // Video time of kickoff. Unknown until set (config, CLI or set_kickoff_time).
  std::optional<double> kickoff_s;

  double first_half_duration_s = 49.0 * 60.0;
  double half_time_duration_s = 15.0 * 60.0;

  // Enables timing-consistency warnings when known.
  std::optional<double> video_duration_s;
};

// -----------------------------
// Output (manifest)
// -----------------------------
struct OutputConfig {
  std::string out_dir = "out";

  // Per-run manifests kept when pruning out_dir.
  int keep_last = 50;
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  std::string match_id = "unknown_match";

  DetectionConfig detection;
  LimitsConfig limits;
  PaddingConfig padding;
  ZoomConfig zoom;
  ReplayConfig replay;
  MatchConfig match;
  OutputConfig output;
};

namespace detail {
inline bool negative(const std::optional<double>& v) { return v && *v < 0.0; }
}  // namespace detail

// Strict validation; fail early.
inline Status validate_config(const Config& cfg) {
  const auto& d = cfg.detection;
  if (d.bucket_size <= 0.0) {
    return Status::invalid_argument("detection.bucket_size must be > 0");
  }
  if (d.min_confidence < 0.0 || d.min_confidence > 1.0) {
    return Status::invalid_argument("detection.min_confidence must be in [0, 1]");
  }
  for (const auto& [name, w] : d.weights) {
    if (w < 0.0) return Status::invalid_argument("detection.weights." + name + " must be >= 0");
  }
  if (d.merge_window_s < 0.0) {
    return Status::invalid_argument("detection.merge_window_s must be >= 0");
  }
  if (d.top_k < 0) {
    return Status::invalid_argument("detection.top_k must be >= 0");
  }
  if (d.dedupe_window_s < 0.0) {
    return Status::invalid_argument("detection.dedupe_window_s must be >= 0");
  }
  if (d.promotion_margin < 0.0) {
    return Status::invalid_argument("detection.promotion_margin must be >= 0");
  }

  const auto& l = cfg.limits;
  if (l.max_clips <= 0) {
    return Status::invalid_argument("limits.max_clips must be > 0");
  }
  if (l.max_clip_len_s <= 0.0) {
    return Status::invalid_argument("limits.max_clip_len_s must be > 0");
  }
  if (l.min_clip_len_s < 0.0 || l.min_clip_len_s > l.max_clip_len_s) {
    return Status::invalid_argument("limits.min_clip_len_s must be in [0, max_clip_len_s]");
  }

  const auto& p = cfg.padding;
  if (p.default_window.pre < 0.0 || p.default_window.post < 0.0) {
    return Status::invalid_argument("padding.default must be >= 0");
  }
  for (const PaddingOverride* o : {&p.save, &p.chance, &p.foul_or_card}) {
    if (detail::negative(o->pre) || detail::negative(o->post)) {
      return Status::invalid_argument("padding overrides must be >= 0");
    }
  }
  if (p.goal_pre_bonus_on_attack < 0.0 || p.goal_post_bonus_on_celebration < 0.0) {
    return Status::invalid_argument("padding.goal bonuses must be >= 0");
  }
  if (p.max_pre < 0.0 || p.max_post < 0.0) {
    return Status::invalid_argument("padding.max_pre / padding.max_post must be >= 0");
  }

  const auto& m = cfg.match;
  if (detail::negative(m.kickoff_s)) {
    return Status::invalid_argument("match.kickoff_s must be >= 0");
  }
  if (m.first_half_duration_s < 0.0 || m.half_time_duration_s < 0.0) {
    return Status::invalid_argument("match half durations must be >= 0");
  }
  if (m.video_duration_s && *m.video_duration_s <= 0.0) {
    return Status::invalid_argument("match.video_duration_s must be > 0");
  }

  if (cfg.output.out_dir.empty()) {
    return Status::invalid_argument("output.out_dir must not be empty");
  }
  if (cfg.output.keep_last < 1) {
    return Status::invalid_argument("output.keep_last must be >= 1");
  }
  return Status::ok_status();
}

}  // namespace reel
