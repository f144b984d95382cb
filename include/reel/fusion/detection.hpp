// File: include/reel/fusion/detection.hpp
#pragma once

#include <map>
#include <string>
#include <variant>
#include <vector>

#include "reel/core/types.hpp"

namespace reel {

// Strength payloads, one per way a detector expresses how sure it is.
// Defaults are what a detector record without the field is taken to mean.

// Ground truth (guided events replayed as a signal). Always full confidence.
struct GroundTruth {};

// Audio energy ratio over the local baseline; typically 0.75..3.0.
struct Energy {
  static constexpr double kExpectedMax = 3.0;
  double value = 1.0;
};

// Optical-flow burst magnitude; typically 2.5..10.0.
struct Magnitude {
  static constexpr double kExpectedMax = 10.0;
  double value = 2.5;
};

// Scene-cut histogram difference; typically 30..100.
struct Difference {
  static constexpr double kExpectedMax = 100.0;
  double value = 30.0;
};

// Detector-reported probability (object detection, whistle, commentary keywords, ...).
struct Confidence {
  double value = 0.5;
};

using Strength = std::variant<GroundTruth, Energy, Magnitude, Difference, Confidence>;

// One timestamped observation from a single detector.
struct Detection {
  Seconds timestamp = 0.0;

  // Detector's own event tag ("audio_spike", "whistle", "ball_near_goal", "goal", ...).
  // Empty means "same as the signal type".
  std::string tag;

  Strength strength = Confidence{};
};

// signal type ("audio", "yolo", ...) -> detections. Missing keys mean "no detections".
using SignalMap = std::map<std::string, std::vector<Detection>>;

// Strength mapped into [0, 1]. Total over the Strength variant; never throws.
double normalized_confidence(const Strength& s);

// Payload kind a signal type's records are read as:
//   json, ground_truth -> GroundTruth
//   audio              -> Energy
//   flow               -> Magnitude
//   scene_cut(s)       -> Difference
//   anything else      -> Confidence
Strength default_strength_for(const std::string& signal_type);

}  // namespace reel
