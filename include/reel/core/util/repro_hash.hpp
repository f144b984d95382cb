// File: include/reel/core/util/repro_hash.hpp
#pragma once

#include <string>

#include "reel/core/config.hpp"

namespace reel {

// Fingerprint of every tunable that changes the EDL (weights, windows, padding, limits, flags).
// Goal: two manifests with the same hash were produced by the same settings.
std::string compute_config_hash(const Config& cfg);

}  // namespace reel
