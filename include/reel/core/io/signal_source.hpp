// File: include/reel/core/io/signal_source.hpp
#pragma once

#include <string>

#include "reel/core/status.hpp"
#include "reel/fusion/detection.hpp"

namespace reel {

// Where detector output comes from. The fusion engine only ever sees the SignalMap.
class ISignalSource {
 public:
  virtual ~ISignalSource() = default;

  // Returns every detection the source has, keyed by signal type.
  // Malformed individual records are skipped (and logged); only source-level failures are errors.
  virtual Result<SignalMap> load() = 0;

  virtual std::string name() const = 0;
};

}  // namespace reel
