// File: src/core/model/edl_runner.cpp
#include "reel/core/model/edl_runner.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "reel/core/util/log.hpp"
#include "reel/core/util/repro_hash.hpp"
#include "reel/edl/edl_processor.hpp"
#include "reel/edl/manifest.hpp"
#include "reel/fusion/signal_fusion.hpp"

namespace reel {
namespace {

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

std::int64_t parse_manifest_epoch_ns_from_name(const std::string& name) {
  const std::string prefix = "manifest_";
  const std::string suffix = ".jsonl";

  // Never touch the stable tail target.
  if (name == "manifest_latest.jsonl") return -1;

  if (name.rfind(prefix, 0) != 0) return -1;
  if (name.size() <= prefix.size() + suffix.size()) return -1;
  if (name.substr(name.size() - suffix.size()) != suffix) return -1;

  const std::string mid =
      name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  if (!is_digits(mid) || mid.size() > 18) return -1;
  return std::stoll(mid);
}

// YYYYmmdd_HHMMSS, local time.
std::string make_run_id() {
  const std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return buf;
}

}  // namespace

EdlRunner::EdlRunner(Config cfg, std::string config_path)
    : cfg_(std::move(cfg)), config_path_(std::move(config_path)) {}

std::int64_t EdlRunner::wall_now_epoch_ns() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

void EdlRunner::prune_out_dir(const std::string& out_dir, std::size_t keep_last) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(out_dir, ec)) return;

  struct Entry {
    std::int64_t key_epoch_ns;
    fs::path path;
  };

  std::vector<Entry> files;
  for (const auto& it : fs::directory_iterator(out_dir, ec)) {
    if (ec) return;
    if (!it.is_regular_file(ec)) continue;

    const std::string name = it.path().filename().string();
    const std::int64_t k = parse_manifest_epoch_ns_from_name(name);
    if (k < 0) continue;

    files.push_back(Entry{k, it.path()});
  }

  if (files.size() <= keep_last) return;

  // Newest first, delete the tail.
  std::sort(files.begin(), files.end(),
            [](const Entry& a, const Entry& b) { return a.key_epoch_ns > b.key_epoch_ns; });

  for (std::size_t i = keep_last; i < files.size(); ++i) {
    fs::remove(files[i].path, ec);
    ec.clear();  // best-effort housekeeping
  }
}

Status EdlRunner::start(ManifestSink& sink) {
  // The new run adds one file, so keep one fewer of the old ones.
  const auto keep = static_cast<std::size_t>(cfg_.output.keep_last);
  prune_out_dir(cfg_.output.out_dir, keep > 0 ? keep - 1 : 0);

  run_id_ = make_run_id();
  started_ = true;

  RunInfo run;
  run.run_id = run_id_;
  run.match_id = cfg_.match_id;
  run.config_path = config_path_;
  run.out_dir = cfg_.output.out_dir;
  run.config_hash = compute_config_hash(cfg_);
  run.wall_start_ns = wall_now_epoch_ns();

  return sink.open(run);
}

Result<RunReport> EdlRunner::run(ManifestSink& sink, ISignalSource* signals,
                                 const std::vector<EventRecord>& guided,
                                 std::optional<Seconds> kickoff_s) {
  if (!started_) {
    return Result<RunReport>::err(Status::invalid_argument("EdlRunner::run called before start"));
  }

  RunReport report;

  // --- Signal fusion
  std::vector<EventRecord> candidates;
  if (signals != nullptr) {
    auto sig_r = signals->load();
    if (!sig_r.ok()) {
      const std::string msg = "signal source '" + signals->name() + "' failed: " +
                              sig_r.status().message() + "; continuing without detections";
      Logger::Warn(msg);
      report.warnings.push_back(msg);
    } else {
      SignalFusion fusion(cfg_.detection);
      auto fused = fusion.fuse(*sig_r);

      std::optional<std::size_t> top_k;
      if (cfg_.detection.top_k > 0) top_k = static_cast<std::size_t>(cfg_.detection.top_k);
      fused = fusion.rank(std::move(fused), top_k);

      if (cfg_.detection.merge_window_s > 0.0) {
        fused = fusion.merge_nearby_events(std::move(fused), cfg_.detection.merge_window_s);
      }
      for (const auto& e : fused) Logger::Debug(SignalFusion::summarize(e));

      report.summary.fused = fused.size();
      candidates = fusion.export_to_events(fused);
    }
  }

  // --- EDL
  EdlProcessor edl(cfg_);
  EdlState state;

  auto load_r = edl.load_guided_events(state, guided);
  if (!load_r.ok()) {
    const std::string msg = "guided events not loaded: " + load_r.status().message();
    report.warnings.push_back(msg);
  } else {
    report.summary.guided_loaded = *load_r;
  }

  const std::optional<Seconds> kickoff = kickoff_s ? kickoff_s : cfg_.match.kickoff_s;
  if (kickoff) {
    const std::size_t before = state.events.size();
    edl.set_kickoff_time(state, *kickoff);
    report.summary.guided_loaded += state.events.size() - before;
  }
  if (!state.pending.empty()) {
    const std::string msg = std::to_string(state.pending.size()) +
                            " guided events have no kickoff reference and were left out";
    Logger::Warn(msg);
    report.warnings.push_back(msg);
    report.summary.guided_deferred = state.pending.size();
  }

  report.summary.auto_added = edl.add_auto_detected_events(state, candidates);
  report.events = edl.process(state);
  report.summary.final_events = report.events.size();

  if (cfg_.match.video_duration_s) {
    for (auto& w : validate_timing_consistency(report.events, *cfg_.match.video_duration_s)) {
      Logger::Warn(w);
      report.warnings.push_back(std::move(w));
    }
  }

  // --- Manifest
  for (const auto& entry : export_manifest(report.events)) {
    REEL_RETURN_IF_ERROR_RESULT(sink.emit(entry), RunReport);
  }
  for (const auto& w : report.warnings) {
    REEL_RETURN_IF_ERROR_RESULT(sink.emit_warning(w), RunReport);
  }
  REEL_RETURN_IF_ERROR_RESULT(sink.finish(report.summary), RunReport);

  return Result<RunReport>::ok(std::move(report));
}

void EdlRunner::stop(ManifestSink& sink) {
  (void)sink.flush();
  sink.close();
  started_ = false;
}

}  // namespace reel
