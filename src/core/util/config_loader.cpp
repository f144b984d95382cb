// File: src/core/util/config_loader.cpp
#include "reel/core/util/config_loader.hpp"

#include <filesystem>
#include <optional>

#include <yaml-cpp/yaml.h>

namespace reel {
namespace fs = std::filesystem;

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, std::optional<T>& out) {
  if (!n || !n[key] || n[key].IsNull()) return;
  out = n[key].as<T>();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, int depth) {
  if (depth > 16) {
    return Result<YAML::Node>::err(Status::invalid_argument("includes nested too deeply at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["base.yaml", "padding.yaml"]
  if (root.IsMap() && root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, depth + 1);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
    root.remove("includes");
  }

  // Finally override with this file's contents.
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static void read_override(const YAML::Node& n, PaddingOverride& out) {
  if (!is_map(n)) return;
  maybe_set(n, "pre", out.pre);
  maybe_set(n, "post", out.post);
}

// Applies every recognised key on top of the defaults already in `cfg`.
static Status apply_yaml(const YAML::Node& y, Config& cfg) {
  if (!y || y.IsNull()) return Status::ok_status();  // empty file: all defaults
  if (!y.IsMap()) return Status::invalid_argument("config root must be a map");

  try {
    maybe_set(y, "match_id", cfg.match_id);

    // --- detection / fusion
    if (is_map(y["detection"])) {
      const auto d = y["detection"];
      if (is_map(d["weights"])) {
        // Listed weights override defaults; unlisted defaults stay.
        for (auto it : d["weights"]) {
          cfg.detection.weights[it.first.as<std::string>()] = it.second.as<double>();
        }
      }
      maybe_set(d, "bucket_size", cfg.detection.bucket_size);
      maybe_set(d, "min_confidence", cfg.detection.min_confidence);
      maybe_set(d, "merge_window_s", cfg.detection.merge_window_s);
      maybe_set(d, "top_k", cfg.detection.top_k);
      maybe_set(d, "dedupe_window_s", cfg.detection.dedupe_window_s);
      maybe_set(d, "promotion_margin", cfg.detection.promotion_margin);
    }

    // --- limits
    if (is_map(y["limits"])) {
      const auto l = y["limits"];
      maybe_set(l, "max_clips", cfg.limits.max_clips);
      maybe_set(l, "min_clip_len_s", cfg.limits.min_clip_len_s);
      maybe_set(l, "max_clip_len_s", cfg.limits.max_clip_len_s);
    }

    // --- padding
    if (is_map(y["padding"])) {
      const auto p = y["padding"];
      if (is_map(p["default"])) {
        maybe_set(p["default"], "pre", cfg.padding.default_window.pre);
        maybe_set(p["default"], "post", cfg.padding.default_window.post);
      }
      read_override(p["save"], cfg.padding.save);
      read_override(p["chance"], cfg.padding.chance);
      read_override(p["foul_or_card"], cfg.padding.foul_or_card);
      if (is_map(p["goal"])) {
        maybe_set(p["goal"], "pre_bonus_on_attack", cfg.padding.goal_pre_bonus_on_attack);
        maybe_set(p["goal"], "post_bonus_on_celebration", cfg.padding.goal_post_bonus_on_celebration);
      }
      maybe_set(p, "max_pre", cfg.padding.max_pre);
      maybe_set(p, "max_post", cfg.padding.max_post);
    }

    // --- feature flags
    if (is_map(y["zoom"])) {
      maybe_set(y["zoom"], "enable", cfg.zoom.enable);
    }
    if (is_map(y["replay"])) {
      const auto r = y["replay"];
      if (r["enable_for"]) {
        if (!r["enable_for"].IsSequence()) {
          return Status::invalid_argument("replay.enable_for must be a YAML sequence");
        }
        cfg.replay.enable_for = r["enable_for"].as<std::vector<std::string>>();
      }
    }

    // --- match timing
    if (is_map(y["match"])) {
      const auto m = y["match"];
      maybe_set(m, "kickoff_s", cfg.match.kickoff_s);
      maybe_set(m, "first_half_duration_s", cfg.match.first_half_duration_s);
      maybe_set(m, "half_time_duration_s", cfg.match.half_time_duration_s);
      maybe_set(m, "video_duration_s", cfg.match.video_duration_s);
    }

    // --- output
    if (is_map(y["output"])) {
      const auto o = y["output"];
      maybe_set(o, "out_dir", cfg.output.out_dir);
      maybe_set(o, "keep_last", cfg.output.keep_last);
    }
  } catch (const YAML::Exception& e) {
    return Status::parse_error(std::string("config value has the wrong type: ") + e.what());
  }
  return Status::ok_status();
}

static Result<Config> build_config(const YAML::Node& y) {
  Config cfg;  // defaults

  const Status applied = apply_yaml(y, cfg);
  if (!applied.ok()) return Result<Config>::err(applied);

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

Result<Config> load_config(const std::string& path_str) {
  auto yaml_r = load_with_includes(fs::path(path_str), 0);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  return build_config(yaml_r.value());
}

Result<Config> load_config_from_string(const std::string& yaml) {
  YAML::Node y;
  try {
    y = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("YAML parse error: ") + e.what()));
  }
  return build_config(y);
}

}  // namespace reel
