// File: src/fusion/detection.cpp
#include "reel/fusion/detection.hpp"

#include <algorithm>
#include <cmath>

namespace reel {
namespace {

double clip01(double v) {
  if (!std::isfinite(v) || v < 0.0) return 0.0;
  return std::min(v, 1.0);
}

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

double normalized_confidence(const Strength& s) {
  return std::visit(
      Overloaded{
          [](const GroundTruth&) { return 1.0; },
          [](const Energy& e) { return clip01(e.value / Energy::kExpectedMax); },
          [](const Magnitude& m) { return clip01(m.value / Magnitude::kExpectedMax); },
          [](const Difference& d) { return clip01(d.value / Difference::kExpectedMax); },
          [](const Confidence& c) { return clip01(c.value); },
      },
      s);
}

Strength default_strength_for(const std::string& signal_type) {
  if (signal_type == "json" || signal_type == "ground_truth") return GroundTruth{};
  if (signal_type == "audio") return Energy{};
  if (signal_type == "flow") return Magnitude{};
  if (signal_type == "scene_cut" || signal_type == "scene_cuts") return Difference{};
  return Confidence{};
}

}  // namespace reel
