// File: include/reel/edl/edl_processor.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "reel/core/config.hpp"
#include "reel/core/status.hpp"
#include "reel/edl/event.hpp"

namespace reel {

// Everything one run knows about its events before the EDL is finalised.
struct EdlState {
  std::vector<Event> events;

  // Guided records with half + clock that arrived before the kickoff reference.
  std::vector<EventRecord> pending;

  std::optional<Seconds> kickoff_s;
  std::optional<Seconds> half_time_marker_s;
  std::optional<Seconds> full_time_marker_s;
};

// Reconciles guided and auto events into the final Edit Decision List.
//
// Intake (load_guided_events, set_kickoff_time, add_auto_detected_events) fills an EdlState.
// The remaining stages take a list and return a new one, in this order:
//   merge_and_dedupe -> compute_adaptive_padding -> apply_feature_flags -> validate_clip_durations
// process() runs them all.
class EdlProcessor {
 public:
  explicit EdlProcessor(Config cfg);

  const Config& config() const { return cfg_; }

  // Validates the whole list first; on any schema error nothing is loaded and the status
  // carries every error. Otherwise returns how many events were added to state.events
  // (records deferred until kickoff are not counted).
  Result<std::size_t> load_guided_events(EdlState& state,
                                         const std::vector<EventRecord>& records) const;

  // Sets the kickoff reference, resolves pending records and recomputes clock-derived times.
  void set_kickoff_time(EdlState& state, Seconds kickoff_s) const;

  // Returns how many candidates became auto events.
  std::size_t add_auto_detected_events(EdlState& state,
                                       const std::vector<EventRecord>& candidates) const;

  std::vector<Event> merge_and_dedupe(std::vector<Event> events) const;
  std::vector<Event> compute_adaptive_padding(std::vector<Event> events) const;
  std::vector<Event> apply_feature_flags(std::vector<Event> events) const;
  std::vector<Event> validate_clip_durations(std::vector<Event> events) const;

  // Priority order: type importance, then confidence, then earliest first.
  static std::vector<Event> rank_events(std::vector<Event> events);

  // Full post-intake pipeline. state.events is replaced with the result.
  std::vector<Event> process(EdlState& state) const;

  // Builds one event from a record. nullopt (with a log line) if its time cannot be resolved.
  std::optional<Event> make_event(const EventRecord& record, EventSource source,
                                  const std::optional<Seconds>& kickoff_s) const;

 private:
  Config cfg_;
};

}  // namespace reel
