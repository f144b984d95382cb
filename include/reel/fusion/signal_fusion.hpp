// File: include/reel/fusion/signal_fusion.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "reel/core/config.hpp"
#include "reel/edl/event.hpp"
#include "reel/fusion/detection.hpp"

namespace reel {

struct ContributingSignal {
  std::string signal_type;  // key in the SignalMap ("audio", "yolo", ...)
  Detection detection;
  double weight = 0.0;
};

// Time-bucketed aggregate of detections from one or more signal types.
struct FusedEvent {
  Seconds timestamp = 0.0;      // mean of contributing timestamps
  std::int64_t bucket_index = 0;

  double score = 0.0;           // raw_score / num_signals
  double raw_score = 0.0;       // sum(weight * normalized confidence)
  int num_signals = 0;

  std::set<std::string> signal_types;  // detector tags seen in the bucket
  std::vector<ContributingSignal> signals;

  int rank = 0;  // 1-based, set by rank()
};

// Fuses independent detector streams into one confidence-ranked timeline.
//
// Usage: fuse() -> rank() -> [merge_nearby_events()] -> export_to_events().
// Every step is a pure function of its inputs and the DetectionConfig.
class SignalFusion {
 public:
  explicit SignalFusion(DetectionConfig cfg = DetectionConfig{});

  const DetectionConfig& config() const { return cfg_; }

  // One FusedEvent per non-empty bucket, ordered by bucket, minus those below min_confidence.
  std::vector<FusedEvent> fuse(const SignalMap& signals) const;

  // Sorted by score descending (stable), truncated to top_k, then ranked 1..N.
  std::vector<FusedEvent> rank(std::vector<FusedEvent> events,
                               std::optional<std::size_t> top_k = std::nullopt) const;

  // Single left-to-right sweep in time order. An event closer than time_window to the start of
  // the current group is folded into it (signals unioned, raw scores and counts summed, score is
  // the max); otherwise it starts a new group.
  std::vector<FusedEvent> merge_nearby_events(std::vector<FusedEvent> events,
                                              Seconds time_window = 3.0) const;

  // Auto candidate records for the EDL, in input order.
  std::vector<EventRecord> export_to_events(const std::vector<FusedEvent>& fused) const;

  // "10.5s [Score: 0.8] - audio, whistle (2 signals)"
  static std::string summarize(const FusedEvent& e);

  // Synthetic type for a fused event: goal > save > foul > goal_like > highlight.
  static std::string classify(const FusedEvent& e);

 private:
  DetectionConfig cfg_;
};

}  // namespace reel
