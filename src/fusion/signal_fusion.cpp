// File: src/fusion/signal_fusion.cpp
#include "reel/fusion/signal_fusion.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <map>
#include <utility>

#include "reel/core/util/log.hpp"

namespace reel {
namespace {

// Goal-like audio spikes need a fused score above this to stand on their own.
constexpr double kStrongAudioScore = 3.0;

struct Bucket {
  std::vector<ContributingSignal> signals;
  std::vector<Seconds> timestamps;
  std::set<std::string> tags;
  double weighted_score = 0.0;
};

std::string format_weight(double w) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%g", w);
  return buf;
}

bool any_tag_contains(const std::set<std::string>& tags, const std::string& needle) {
  for (const auto& t : tags) {
    if (t.find(needle) != std::string::npos) return true;
  }
  return false;
}

}  // namespace

SignalFusion::SignalFusion(DetectionConfig cfg) : cfg_(std::move(cfg)) {}

std::vector<FusedEvent> SignalFusion::fuse(const SignalMap& signals) const {
  Logger::Info("Fusing detection signals...");

  // Ordered by bucket index so the output does not depend on hashing or input order.
  std::map<std::int64_t, Bucket> buckets;

  for (const auto& [signal_type, detections] : signals) {
    if (detections.empty()) continue;

    const double weight = cfg_.weight_for(signal_type);
    Logger::Info("  processing " + std::to_string(detections.size()) + " " + signal_type +
                 " detections (weight=" + format_weight(weight) + ")");

    for (const auto& d : detections) {
      if (!std::isfinite(d.timestamp) || d.timestamp < 0.0) {
        Logger::Warn("skipping " + signal_type + " detection with invalid timestamp");
        continue;
      }

      const auto idx = static_cast<std::int64_t>(std::floor(d.timestamp / cfg_.bucket_size));
      Bucket& b = buckets[idx];
      b.signals.push_back(ContributingSignal{signal_type, d, weight});
      b.timestamps.push_back(d.timestamp);
      b.tags.insert(d.tag.empty() ? signal_type : d.tag);
      b.weighted_score += weight * normalized_confidence(d.strength);
    }
  }
  Logger::Info("  created " + std::to_string(buckets.size()) + " time buckets");

  std::vector<FusedEvent> out;
  out.reserve(buckets.size());
  for (auto& [idx, b] : buckets) {
    double sum_t = 0.0;
    for (Seconds t : b.timestamps) sum_t += t;

    FusedEvent e;
    e.bucket_index = idx;
    e.num_signals = static_cast<int>(b.signals.size());
    e.timestamp = sum_t / static_cast<double>(b.timestamps.size());
    e.raw_score = b.weighted_score;
    e.score = b.weighted_score / static_cast<double>(std::max(e.num_signals, 1));
    e.signal_types = std::move(b.tags);
    e.signals = std::move(b.signals);

    if (e.score < cfg_.min_confidence) continue;
    out.push_back(std::move(e));
  }

  Logger::Info("  kept " + std::to_string(out.size()) + " of " + std::to_string(buckets.size()) +
               " events above threshold (" + format_weight(cfg_.min_confidence) + ")");
  return out;
}

std::vector<FusedEvent> SignalFusion::rank(std::vector<FusedEvent> events,
                                           std::optional<std::size_t> top_k) const {
  std::stable_sort(events.begin(), events.end(),
                   [](const FusedEvent& a, const FusedEvent& b) { return a.score > b.score; });

  if (top_k && events.size() > *top_k) events.resize(*top_k);

  int r = 1;
  for (auto& e : events) e.rank = r++;
  return events;
}

std::vector<FusedEvent> SignalFusion::merge_nearby_events(std::vector<FusedEvent> events,
                                                          Seconds time_window) const {
  if (events.empty()) return {};

  std::stable_sort(events.begin(), events.end(), [](const FusedEvent& a, const FusedEvent& b) {
    return a.timestamp < b.timestamp;
  });

  std::vector<FusedEvent> merged;
  FusedEvent current = std::move(events.front());

  for (std::size_t i = 1; i < events.size(); ++i) {
    FusedEvent& e = events[i];
    if (e.timestamp - current.timestamp < time_window) {
      current.signals.insert(current.signals.end(), std::make_move_iterator(e.signals.begin()),
                             std::make_move_iterator(e.signals.end()));
      current.signal_types.insert(e.signal_types.begin(), e.signal_types.end());
      current.raw_score += e.raw_score;
      // Max, not sum: many weak neighbours must not inflate the score.
      current.score = std::max(current.score, e.score);
      current.num_signals += e.num_signals;
    } else {
      merged.push_back(std::move(current));
      current = std::move(e);
    }
  }
  merged.push_back(std::move(current));

  if (merged.size() != events.size()) {
    Logger::Info("Merged " + std::to_string(events.size()) + " fused events into " +
                 std::to_string(merged.size()));
  }
  return merged;
}

std::string SignalFusion::classify(const FusedEvent& e) {
  if (any_tag_contains(e.signal_types, "goal")) return "goal";
  if (any_tag_contains(e.signal_types, "save")) return "save";
  if (e.signal_types.count("whistle") > 0) return "foul";
  if (e.signal_types.count("audio_spike") > 0 && e.score > kStrongAudioScore) return "goal_like";
  return "highlight";
}

std::vector<EventRecord> SignalFusion::export_to_events(const std::vector<FusedEvent>& fused) const {
  std::vector<EventRecord> out;
  out.reserve(fused.size());

  int n = 1;
  for (const auto& e : fused) {
    EventRecord r;
    r.id = "auto_" + std::to_string(n++);
    r.type = classify(e);
    r.abs_ts = EventRecord::TimeField{e.timestamp};
    r.minute = static_cast<int>(std::floor(e.timestamp / 60.0));
    r.confidence = e.score;

    // Distinct signal types, first appearance first.
    for (const auto& s : e.signals) {
      if (std::find(r.signals.begin(), r.signals.end(), s.signal_type) == r.signals.end()) {
        r.signals.push_back(s.signal_type);
      }
    }
    out.push_back(std::move(r));
  }
  return out;
}

std::string SignalFusion::summarize(const FusedEvent& e) {
  std::set<std::string> types;
  for (const auto& s : e.signals) types.insert(s.signal_type);

  std::string joined;
  for (const auto& t : types) {
    if (!joined.empty()) joined += ", ";
    joined += t;
  }

  char head[96];
  std::snprintf(head, sizeof(head), "%.1fs [Score: %.1f] - ", e.timestamp, e.score);
  return std::string(head) + joined + " (" + std::to_string(e.num_signals) + " signals)";
}

}  // namespace reel
