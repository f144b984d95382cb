// File: include/reel/adapters/synth/synth_signal_source.hpp
#pragma once

#include <cstdint>
#include <string>

#include "reel/core/io/signal_source.hpp"

namespace reel {

struct SynthSignalSourceConfig {
  double duration_s{95.0 * 60.0};

  // Moments where several detectors fire together (crowd + whistle + vision).
  int num_key_moments{8};

  // Uncorrelated background detections per minute of video (flow bursts, scene cuts).
  double noise_per_minute{2.0};

  std::uint32_t seed{1};
};

// Deterministic synthetic detector output. Same seed, same SignalMap.
class SynthSignalSource final : public ISignalSource {
 public:
  explicit SynthSignalSource(SynthSignalSourceConfig cfg);

  Result<SignalMap> load() override;

  std::string name() const override { return "synth"; }

 private:
  SynthSignalSourceConfig cfg_;
};

}  // namespace reel
