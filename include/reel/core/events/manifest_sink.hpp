// File: include/reel/core/events/manifest_sink.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "reel/core/status.hpp"
#include "reel/edl/manifest.hpp"

namespace reel {

struct RunInfo {
  std::string run_id;
  std::string match_id;
  std::string config_path;
  std::string out_dir;
  std::string config_hash;

  // Wall-clock start, epoch nanoseconds. Names the per-run manifest file.
  std::int64_t wall_start_ns = 0;
};

// Closing summary line.
struct RunSummary {
  std::size_t guided_loaded = 0;
  std::size_t guided_deferred = 0;
  std::size_t fused = 0;
  std::size_t auto_added = 0;
  std::size_t final_events = 0;
};

class ManifestSink {
 public:
  virtual ~ManifestSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const ManifestEntry& e) = 0;
  virtual Status emit_warning(const std::string& message) = 0;
  virtual Status finish(const RunSummary& summary) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace reel
