// File: include/reel/core/events/jsonl_manifest_sink.hpp
#pragma once

#include <fstream>
#include <string>

#include "reel/core/events/manifest_sink.hpp"
#include "reel/core/status.hpp"

namespace reel {

// JSONL sink for the EDL.
// Writes every line to:
//   1) a unique per-run file: manifest_<wall_start_ns>.jsonl
//   2) a stable "latest" file: manifest_latest.jsonl (truncated each run)
class JsonlManifestSink final : public ManifestSink {
 public:
  JsonlManifestSink() = default;
  ~JsonlManifestSink() override;

  const std::string& path() const { return path_; }
  const std::string& latest_path() const { return latest_path_; }

  Status open(const RunInfo& run) override;
  Status emit(const ManifestEntry& e) override;
  Status emit_warning(const std::string& message) override;
  Status finish(const RunSummary& summary) override;
  Status flush() override;
  void close() override;

  // JSON object for one entry (no trailing newline).
  static std::string to_json(const ManifestEntry& e);

 private:
  Status write_line_(const std::string& line);

  bool open_{false};

  std::string path_;
  std::string latest_path_;

  std::ofstream f_;
  std::ofstream latest_;
};

// JSON string literal for `s`, quotes included.
std::string json_quote(const std::string& s);

}  // namespace reel
