// File: src/core/util/repro_hash.cpp
#include "reel/core/util/repro_hash.hpp"

#include <bit>
#include <cstdint>
#include <optional>
#include <string>

namespace reel {
namespace {

// FNV-1a 64-bit. Not cryptographic; stable across runs and platforms of the same endianness.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i32(std::int32_t v)  { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_double(double v) { add_u64(std::bit_cast<std::uint64_t>(v)); }

  // Presence flag first so "unset" and "set to 0" differ.
  void add_optional(const std::optional<double>& v) {
    add_bool(v.has_value());
    if (v) add_double(*v);
  }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

void add_override(Fnv1a64& h, const PaddingOverride& o) {
  h.add_optional(o.pre);
  h.add_optional(o.post);
}

}  // namespace

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  // Detection. std::map iterates in key order, so the weight table hashes deterministically.
  h.add_u64(static_cast<std::uint64_t>(cfg.detection.weights.size()));
  for (const auto& [name, w] : cfg.detection.weights) {
    h.add_string(name);
    h.add_double(w);
  }
  h.add_double(cfg.detection.bucket_size);
  h.add_double(cfg.detection.min_confidence);
  h.add_double(cfg.detection.merge_window_s);
  h.add_i32(cfg.detection.top_k);
  h.add_double(cfg.detection.dedupe_window_s);
  h.add_double(cfg.detection.promotion_margin);

  // Limits.
  h.add_i32(cfg.limits.max_clips);
  h.add_double(cfg.limits.min_clip_len_s);
  h.add_double(cfg.limits.max_clip_len_s);

  // Padding.
  h.add_double(cfg.padding.default_window.pre);
  h.add_double(cfg.padding.default_window.post);
  add_override(h, cfg.padding.save);
  add_override(h, cfg.padding.chance);
  add_override(h, cfg.padding.foul_or_card);
  h.add_double(cfg.padding.goal_pre_bonus_on_attack);
  h.add_double(cfg.padding.goal_post_bonus_on_celebration);
  h.add_double(cfg.padding.max_pre);
  h.add_double(cfg.padding.max_post);

  // Feature flags.
  h.add_bool(cfg.zoom.enable);
  h.add_u64(static_cast<std::uint64_t>(cfg.replay.enable_for.size()));
  for (const auto& t : cfg.replay.enable_for) h.add_string(t);

  // Match timing.
  h.add_optional(cfg.match.kickoff_s);
  h.add_double(cfg.match.first_half_duration_s);
  h.add_double(cfg.match.half_time_duration_s);
  h.add_optional(cfg.match.video_duration_s);

  // match_id and output settings do not change the EDL and are not hashed.
  return to_hex(h.h);
}

}  // namespace reel
