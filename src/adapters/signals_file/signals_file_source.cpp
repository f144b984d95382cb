// File: src/adapters/signals_file/signals_file_source.cpp
#include "reel/adapters/signals_file/signals_file_source.hpp"

#include <cmath>
#include <filesystem>
#include <optional>
#include <utility>
#include <variant>

#include <yaml-cpp/yaml.h>

#include "reel/core/util/log.hpp"

namespace reel {
namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Reads `key` into `out` when present and numeric; keeps the default otherwise.
void read_strength_field(const YAML::Node& n, const char* key, double& out) {
  const YAML::Node v = n[key];
  if (!v || !v.IsScalar()) return;
  double d = 0.0;
  if (YAML::convert<double>::decode(v, d) && std::isfinite(d)) out = d;
}

std::optional<Detection> detection_from_node(const YAML::Node& n, const std::string& signal_type) {
  if (!n.IsMap()) return std::nullopt;

  const YAML::Node ts = n["timestamp"];
  double t = 0.0;
  if (!ts || !ts.IsScalar() || !YAML::convert<double>::decode(ts, t) || !std::isfinite(t) || t < 0.0) {
    return std::nullopt;
  }

  Detection d;
  d.timestamp = t;

  const YAML::Node tag = n["type"];
  if (tag && tag.IsScalar()) d.tag = tag.Scalar();

  d.strength = default_strength_for(signal_type);
  std::visit(Overloaded{
                 [](GroundTruth&) {},
                 [&](Energy& e) { read_strength_field(n, "energy", e.value); },
                 [&](Magnitude& m) { read_strength_field(n, "magnitude", m.value); },
                 [&](Difference& df) { read_strength_field(n, "difference", df.value); },
                 [&](Confidence& c) { read_strength_field(n, "confidence", c.value); },
             },
             d.strength);
  return d;
}

Result<SignalMap> signals_from_root(const YAML::Node& doc) {
  if (!doc || doc.IsNull()) return Result<SignalMap>::ok({});

  const bool wrapped = doc.IsMap() && doc["signals"] && doc["signals"].IsMap();
  const YAML::Node root = wrapped ? doc["signals"] : doc;
  if (!root.IsMap()) {
    return Result<SignalMap>::err(
        Status::invalid_argument("detections document must map signal types to lists"));
  }

  SignalMap out;
  for (auto it : root) {
    const std::string signal_type = it.first.as<std::string>();
    const YAML::Node list = it.second;

    auto& dst = out[signal_type];
    if (!list || list.IsNull()) continue;
    if (!list.IsSequence()) {
      Logger::Warn("signal '" + signal_type + "' is not a list; treating it as empty");
      continue;
    }

    std::size_t skipped = 0;
    for (const auto& n : list) {
      auto d = detection_from_node(n, signal_type);
      if (d) dst.push_back(std::move(*d));
      else ++skipped;
    }
    if (skipped > 0) {
      Logger::Warn("skipped " + std::to_string(skipped) + " malformed " + signal_type + " detections");
    }
  }
  return Result<SignalMap>::ok(std::move(out));
}

}  // namespace

SignalsFileSource::SignalsFileSource(SignalsFileSourceConfig cfg) : cfg_(std::move(cfg)) {}

Result<SignalMap> SignalsFileSource::load() {
  if (cfg_.path.empty()) {
    return Result<SignalMap>::err(Status::invalid_argument("SignalsFileSource: path is empty"));
  }
  std::error_code ec;
  if (!std::filesystem::exists(cfg_.path, ec)) {
    return Result<SignalMap>::err(Status::not_found("SignalsFileSource: file not found: " + cfg_.path));
  }
  try {
    return signals_from_root(YAML::LoadFile(cfg_.path));
  } catch (const YAML::Exception& e) {
    return Result<SignalMap>::err(Status::parse_error("SignalsFileSource: " + cfg_.path + ": " + e.what()));
  }
}

Result<SignalMap> parse_signals(const std::string& text) {
  try {
    return signals_from_root(YAML::Load(text));
  } catch (const YAML::Exception& e) {
    return Result<SignalMap>::err(Status::parse_error(std::string("detections document: ") + e.what()));
  }
}

}  // namespace reel
