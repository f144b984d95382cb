// File: include/reel/core/model/edl_runner.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "reel/core/config.hpp"
#include "reel/core/events/manifest_sink.hpp"
#include "reel/core/io/signal_source.hpp"
#include "reel/core/status.hpp"
#include "reel/edl/event.hpp"

namespace reel {

struct RunReport {
  RunSummary summary;
  std::vector<Event> events;
  std::vector<std::string> warnings;
};

// EdlRunner owns one run, start to finish:
//   signals -> fuse -> rank -> [merge nearby] -> auto candidates
//   guided records -> load -> kickoff -> + auto -> dedupe -> padding -> flags -> durations
//   -> manifest
// Input problems degrade the result (fewer events, warnings); only sink failures are errors.
class EdlRunner {
 public:
  EdlRunner(Config cfg, std::string config_path);

  Status start(ManifestSink& sink);

  // `signals` may be null (guided-only run). `kickoff_s` overrides match.kickoff_s.
  Result<RunReport> run(ManifestSink& sink, ISignalSource* signals,
                        const std::vector<EventRecord>& guided,
                        std::optional<Seconds> kickoff_s = std::nullopt);

  void stop(ManifestSink& sink);

  const std::string& run_id() const { return run_id_; }

 private:
  static std::int64_t wall_now_epoch_ns();
  static void prune_out_dir(const std::string& out_dir, std::size_t keep_last);

  Config cfg_;
  std::string config_path_;
  std::string run_id_;
  bool started_{false};
};

}  // namespace reel
