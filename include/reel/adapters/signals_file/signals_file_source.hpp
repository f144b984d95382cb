// File: include/reel/adapters/signals_file/signals_file_source.hpp
#pragma once

#include <string>

#include "reel/core/io/signal_source.hpp"

namespace reel {

// Detections file (JSON or YAML):
//   audio:   [{timestamp: 10.5, energy: 2.3, type: audio_spike}, ...]
//   whistle: [{timestamp: 11.2, confidence: 0.8}, ...]
// optionally wrapped in a top-level `signals:` map.
struct SignalsFileSourceConfig {
  std::string path;
};

class SignalsFileSource final : public ISignalSource {
 public:
  explicit SignalsFileSource(SignalsFileSourceConfig cfg);

  Result<SignalMap> load() override;

  std::string name() const override { return "signals_file"; }

 private:
  SignalsFileSourceConfig cfg_;
};

// Parses a detections document held in memory.
Result<SignalMap> parse_signals(const std::string& text);

}  // namespace reel
