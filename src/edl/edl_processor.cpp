// File: src/edl/edl_processor.cpp
#include "reel/edl/edl_processor.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <utility>

#include "reel/core/util/log.hpp"
#include "reel/core/util/timecode.hpp"
#include "reel/edl/event_records.hpp"
#include "reel/edl/event_types.hpp"

namespace reel {
namespace {

// Absorbs floating-point noise in confidence and duration comparisons.
constexpr double kEps = 1e-9;

std::string describe(const EventRecord& r) {
  std::string s = r.type.empty() ? std::string("<untyped>") : r.type;
  if (r.half) s += " half=" + std::to_string(*r.half);
  if (r.clock) s += " clock=" + *r.clock;
  return s;
}

std::string fmt_s(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1fs", v);
  return buf;
}

std::string where(const Event& e) { return e.type + " at " + seconds_to_timestamp(e.abs_ts); }

MatchTiming timing_of(const MatchConfig& m) {
  MatchTiming t;
  t.first_half_duration_s = m.first_half_duration_s;
  t.half_time_duration_s = m.half_time_duration_s;
  return t;
}

void refresh_markers(EdlState& state) {
  state.half_time_marker_s.reset();
  state.full_time_marker_s.reset();
  for (const auto& e : state.events) {
    if (!e.is_guided() || !e.status) continue;
    if (*e.status == MatchStatus::kHalfTime) state.half_time_marker_s = e.abs_ts;
    else state.full_time_marker_s = e.abs_ts;
  }
}

double apply_override(const std::optional<double>& v, double fallback) {
  return v ? *v : fallback;
}

}  // namespace

EdlProcessor::EdlProcessor(Config cfg) : cfg_(std::move(cfg)) {}

std::optional<Event> EdlProcessor::make_event(const EventRecord& r, EventSource source,
                                              const std::optional<Seconds>& kickoff_s) const {
  if (r.type.empty()) {
    Logger::Warn("Skipping event without a type");
    return std::nullopt;
  }

  Event e(source);
  e.id = r.id;
  e.type = r.type;

  if (r.abs_ts) {
    if (const auto* secs = std::get_if<Seconds>(&*r.abs_ts)) {
      e.abs_ts = *secs;
    } else {
      auto ts = parse_timestamp(std::get<std::string>(*r.abs_ts));
      if (!ts.ok()) {
        Logger::Warn("Skipping event " + describe(r) + ": " + ts.status().message());
        return std::nullopt;
      }
      e.abs_ts = *ts;
    }
  } else if (kickoff_s && r.half && r.clock) {
    auto ts = compute_absolute_time(*r.half, *r.clock, *kickoff_s, timing_of(cfg_.match));
    if (!ts.ok()) {
      Logger::Warn("Skipping event " + describe(r) + ": " + ts.status().message());
      return std::nullopt;
    }
    e.abs_ts = *ts;
    e.abs_ts_from_clock = true;
  } else {
    Logger::Warn("Cannot compute abs_ts for event " + describe(r));
    return std::nullopt;
  }

  if (!std::isfinite(e.abs_ts) || e.abs_ts < 0.0) {
    Logger::Warn("Skipping event " + describe(r) + ": negative or invalid abs_ts");
    return std::nullopt;
  }

  e.half = r.half;
  e.clock = r.clock;
  e.minute = r.minute;
  e.team = r.team;
  e.player = r.player;
  e.assist = r.assist;
  e.notes = r.notes;

  if (r.score) {
    if (const auto* s = std::get_if<MatchScore>(&*r.score)) {
      e.score = *s;
    } else {
      e.score = parse_score(std::get<std::string>(*r.score));
      if (!e.score) Logger::Debug("Dropping unparseable score for " + describe(r));
    }
  }

  if (r.status) {
    e.status = parse_match_status(*r.status);
    if (!e.status) Logger::Warn("Ignoring unknown status '" + *r.status + "' on " + describe(r));
  }

  const double c = r.confidence.value_or(1.0);
  e.confidence = std::isfinite(c) ? std::clamp(c, 0.0, 1.0) : 0.0;
  e.signals = r.signals;
  return e;
}

Result<std::size_t> EdlProcessor::load_guided_events(EdlState& state,
                                                     const std::vector<EventRecord>& records) const {
  const auto errors = validate_event_records(records);
  if (!errors.empty()) {
    for (const auto& err : errors) Logger::Error("Event validation error: " + err);
    return Result<std::size_t>::err(Status::invalid_argument(
        "guided events failed validation (" + std::to_string(errors.size()) + " errors): " +
        errors.front()));
  }

  std::size_t loaded = 0;
  for (const auto& r : records) {
    if (!r.abs_ts && !state.kickoff_s) {
      Logger::Warn("Cannot compute abs_ts for event " + describe(r) +
                   " yet; deferred until kickoff time is set");
      state.pending.push_back(r);
      continue;
    }

    try {
      auto e = make_event(r, EventSource::kGuided, state.kickoff_s);
      if (!e) continue;
      state.events.push_back(std::move(*e));
      ++loaded;
    } catch (const std::exception& ex) {
      Logger::Error("Failed to create event from " + describe(r) + ": " + ex.what());
    }
  }

  refresh_markers(state);
  Logger::Info("Loaded " + std::to_string(loaded) + " guided events");
  return Result<std::size_t>::ok(loaded);
}

void EdlProcessor::set_kickoff_time(EdlState& state, Seconds kickoff_s) const {
  state.kickoff_s = kickoff_s;
  const MatchTiming timing = timing_of(cfg_.match);

  for (auto& e : state.events) {
    if (!e.is_guided() || !e.abs_ts_from_clock || !e.half || !e.clock) continue;
    auto ts = compute_absolute_time(*e.half, *e.clock, kickoff_s, timing);
    if (ts.ok()) e.abs_ts = *ts;
  }

  std::size_t resolved = 0;
  for (const auto& r : state.pending) {
    try {
      auto e = make_event(r, EventSource::kGuided, state.kickoff_s);
      if (!e) continue;
      state.events.push_back(std::move(*e));
      ++resolved;
    } catch (const std::exception& ex) {
      Logger::Error("Failed to create event from " + describe(r) + ": " + ex.what());
    }
  }
  state.pending.clear();

  refresh_markers(state);
  if (resolved > 0) {
    Logger::Info("Resolved " + std::to_string(resolved) + " deferred guided events at kickoff " +
                 seconds_to_timestamp(kickoff_s));
  }
}

std::size_t EdlProcessor::add_auto_detected_events(EdlState& state,
                                                   const std::vector<EventRecord>& candidates) const {
  std::size_t added = 0;
  for (const auto& c : candidates) {
    try {
      auto e = make_event(c, EventSource::kAuto, state.kickoff_s);
      if (!e) continue;
      state.events.push_back(std::move(*e));
      ++added;
    } catch (const std::exception& ex) {
      Logger::Error("Failed to create auto event from " + describe(c) + ": " + ex.what());
    }
  }
  Logger::Info("Added " + std::to_string(added) + " auto-detected candidates");
  return added;
}

std::vector<Event> EdlProcessor::merge_and_dedupe(std::vector<Event> events) const {
  const double window = cfg_.detection.dedupe_window_s;
  const double margin = cfg_.detection.promotion_margin;

  std::vector<Event> retained;
  std::vector<Event> auto_events;
  for (auto& e : events) {
    if (e.is_guided()) retained.push_back(std::move(e));
    else auto_events.push_back(std::move(e));
  }

  // Each auto event is checked against everything retained so far (guided events, plus autos
  // accepted earlier in the sweep). It replaces its conflicts only if it beats every one of them
  // by the margin; otherwise it is dropped. Either way one event survives per conflict cluster.
  for (auto& a : auto_events) {
    const auto conflicts = [&](const Event& r) {
      return types_related(a.type, r.type) && std::fabs(a.abs_ts - r.abs_ts) < window;
    };

    const Event* strongest = nullptr;
    for (const auto& r : retained) {
      if (conflicts(r) && (!strongest || r.confidence > strongest->confidence)) strongest = &r;
    }

    if (!strongest) {
      Logger::Info("Auto event added: " + where(a));
      retained.push_back(std::move(a));
      continue;
    }

    if (a.confidence + kEps >= strongest->confidence + margin) {
      for (const auto& r : retained) {
        if (!conflicts(r)) continue;
        Logger::Info("Auto event replaces " + std::string(to_string(r.source())) + " " + where(r) +
                     " with " + where(a));
      }
      retained.erase(std::remove_if(retained.begin(), retained.end(), conflicts), retained.end());
      retained.push_back(std::move(a));
    } else {
      Logger::Debug("Auto event dropped in favour of " + where(*strongest) + ": " + where(a));
    }
  }

  std::stable_sort(retained.begin(), retained.end(),
                   [](const Event& x, const Event& y) { return x.abs_ts < y.abs_ts; });

  const auto max_clips = static_cast<std::size_t>(cfg_.limits.max_clips);
  if (retained.size() > max_clips) {
    retained = rank_events(std::move(retained));
    retained.erase(retained.begin() + static_cast<std::ptrdiff_t>(max_clips), retained.end());
    Logger::Info("Limited to " + std::to_string(max_clips) + " clips");
  }
  return retained;
}

std::vector<Event> EdlProcessor::rank_events(std::vector<Event> events) {
  std::stable_sort(events.begin(), events.end(), [](const Event& a, const Event& b) {
    const int pa = priority_score(a.type);
    const int pb = priority_score(b.type);
    if (pa != pb) return pa > pb;
    if (a.confidence != b.confidence) return a.confidence > b.confidence;
    return a.abs_ts < b.abs_ts;
  });
  return events;
}

std::vector<Event> EdlProcessor::compute_adaptive_padding(std::vector<Event> events) const {
  const PaddingConfig& p = cfg_.padding;

  for (auto& e : events) {
    double pre = p.default_window.pre;
    double post = p.default_window.post;

    if (e.type == "goal") {
      if (e.has_signal("build_up") || e.has_signal("attack")) pre += p.goal_pre_bonus_on_attack;
      if (e.has_signal("celebration")) post += p.goal_post_bonus_on_celebration;
    } else if (e.type == "big_save" || e.type == "save") {
      pre = apply_override(p.save.pre, pre);
      post = apply_override(p.save.post, post);
    } else if (e.type == "chance") {
      pre = apply_override(p.chance.pre, pre);
      post = apply_override(p.chance.post, post);
    } else if (e.type == "foul" || e.type == "card") {
      pre = apply_override(p.foul_or_card.pre, pre);
      post = apply_override(p.foul_or_card.post, post);
    }

    e.pre_padding = std::min(pre, p.max_pre);
    e.post_padding = std::min(post, p.max_post);

    Logger::Info("Clip planned: " + where(e) + " pre=" + fmt_s(e.pre_padding) +
                 " post=" + fmt_s(e.post_padding) + " total=" + fmt_s(e.duration()));
  }
  return events;
}

std::vector<Event> EdlProcessor::apply_feature_flags(std::vector<Event> events) const {
  const auto& replay_types = cfg_.replay.enable_for;
  for (auto& e : events) {
    e.zoom_enabled = cfg_.zoom.enable;
    e.replay_enabled =
        std::find(replay_types.begin(), replay_types.end(), e.type) != replay_types.end();
  }
  return events;
}

std::vector<Event> EdlProcessor::validate_clip_durations(std::vector<Event> events) const {
  const double min_len = cfg_.limits.min_clip_len_s;
  const double max_len = cfg_.limits.max_clip_len_s;

  for (auto& e : events) {
    const double total = e.duration();

    if (total < min_len - kEps) {
      // Short clips grow at the tail.
      e.post_padding = min_len - e.pre_padding;
      Logger::Info("Extended clip for " + where(e) + " to minimum " + fmt_s(min_len));
    } else if (total > max_len + kEps) {
      // Long clips shrink proportionally, keeping the pre:post ratio.
      const double scale = max_len / total;
      e.pre_padding *= scale;
      e.post_padding = max_len - e.pre_padding;
      Logger::Info("Reduced clip for " + where(e) + " to maximum " + fmt_s(max_len));
    }
  }
  return events;
}

std::vector<Event> EdlProcessor::process(EdlState& state) const {
  std::vector<Event> events = merge_and_dedupe(std::move(state.events));
  events = compute_adaptive_padding(std::move(events));
  events = apply_feature_flags(std::move(events));
  events = validate_clip_durations(std::move(events));
  state.events = events;
  return events;
}

}  // namespace reel
