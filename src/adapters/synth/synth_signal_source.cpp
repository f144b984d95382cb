// File: src/adapters/synth/synth_signal_source.cpp
#include "reel/adapters/synth/synth_signal_source.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <utility>

namespace reel {
namespace {

void sort_by_time(std::vector<Detection>& v) {
  std::sort(v.begin(), v.end(),
            [](const Detection& a, const Detection& b) { return a.timestamp < b.timestamp; });
}

}  // namespace

SynthSignalSource::SynthSignalSource(SynthSignalSourceConfig cfg) : cfg_(std::move(cfg)) {}

Result<SignalMap> SynthSignalSource::load() {
  if (cfg_.duration_s <= 0.0) {
    return Result<SignalMap>::err(Status::invalid_argument("SynthSignalSource: duration_s must be > 0"));
  }
  if (cfg_.num_key_moments < 0 || cfg_.noise_per_minute < 0.0) {
    return Result<SignalMap>::err(Status::invalid_argument("SynthSignalSource: counts must be >= 0"));
  }

  std::mt19937 rng(cfg_.seed);
  std::uniform_real_distribution<double> when(0.0, cfg_.duration_s);
  std::uniform_real_distribution<double> jitter(0.0, 0.8);  // stays inside a 1 s bucket mostly
  std::uniform_real_distribution<double> unit(0.0, 1.0);

  SignalMap out;
  auto& audio = out["audio"];
  auto& whistle = out["whistle"];
  auto& yolo = out["yolo"];
  auto& flow = out["flow"];
  auto& scene = out["scene_cut"];

  // Correlated moments: crowd spike, whistle, and (every other one) a goal-mouth detection.
  for (int i = 0; i < cfg_.num_key_moments; ++i) {
    const double t = std::floor(when(rng));
    audio.push_back(Detection{t + jitter(rng), "audio_spike", Energy{1.5 + 1.5 * unit(rng)}});
    whistle.push_back(Detection{t + jitter(rng), "whistle", Confidence{0.6 + 0.4 * unit(rng)}});
    if (i % 2 == 0) {
      yolo.push_back(Detection{t + jitter(rng), "ball_near_goal", Confidence{0.7 + 0.3 * unit(rng)}});
    }
  }

  // Background noise.
  const int noise = static_cast<int>(std::lround(cfg_.noise_per_minute * cfg_.duration_s / 60.0));
  for (int i = 0; i < noise; ++i) {
    if (i % 3 == 0) {
      scene.push_back(Detection{when(rng), "scene_cut", Difference{30.0 + 40.0 * unit(rng)}});
    } else {
      flow.push_back(Detection{when(rng), "flow_burst", Magnitude{2.5 + 4.0 * unit(rng)}});
    }
  }

  for (auto& [type, dets] : out) sort_by_time(dets);
  return Result<SignalMap>::ok(std::move(out));
}

}  // namespace reel
