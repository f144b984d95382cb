// File: src/apps/reel_edl/main.cpp
#include <cstdint>
#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "reel/adapters/signals_file/signals_file_source.hpp"
#include "reel/adapters/synth/synth_signal_source.hpp"
#include "reel/core/events/jsonl_manifest_sink.hpp"
#include "reel/core/io/signal_source.hpp"
#include "reel/core/model/edl_runner.hpp"
#include "reel/core/util/config_loader.hpp"
#include "reel/core/util/log.hpp"
#include "reel/core/util/timecode.hpp"
#include "reel/edl/event_records.hpp"

namespace {

struct Args {
  std::string config_path;
  std::string events_path;
  std::string signals_path;
  std::string out_dir;
  std::optional<double> kickoff_s;
  bool synth{false};
  std::uint32_t seed{1};
  bool quiet{false};
  bool help{false};
  std::string error;
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    const bool has_value = i + 1 < argc;
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && has_value) {
      a.config_path = argv[++i];
      continue;
    }
    if (s == "--events" && has_value) {
      a.events_path = argv[++i];
      continue;
    }
    if (s == "--signals" && has_value) {
      a.signals_path = argv[++i];
      continue;
    }
    if (s == "--out" && has_value) {
      a.out_dir = argv[++i];
      continue;
    }
    if (s == "--kickoff" && has_value) {
      auto k = reel::parse_timestamp(argv[++i]);
      if (!k.ok()) {
        a.error = "--kickoff: " + k.status().message();
        return a;
      }
      a.kickoff_s = *k;
      continue;
    }
    if (s == "--seed" && has_value) {
      a.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
      continue;
    }
    if (s == "--synth") {
      a.synth = true;
      continue;
    }
    if (s == "--quiet" || s == "-q") {
      a.quiet = true;
      continue;
    }
    a.error = "unknown or incomplete argument: " + s;
    return a;
  }
  if (!a.synth && a.signals_path.empty() && a.events_path.empty()) {
    a.error = "nothing to do: give --events, --signals or --synth";
  }
  if (a.synth && !a.signals_path.empty()) {
    a.error = "--signals and --synth are mutually exclusive";
  }
  return a;
}

void print_usage() {
  std::cout << "reel_edl\n"
            << "  --config <path>       YAML config (defaults apply when omitted)\n"
            << "  --events <path>       guided events (JSON or YAML)\n"
            << "  --signals <path>      detector output (JSON or YAML)\n"
            << "  --synth [--seed N]    synthetic detector output instead of --signals\n"
            << "  --kickoff <time>      kickoff in video time (seconds or HH:MM:SS)\n"
            << "  --out <dir>           output directory (overrides output.out_dir)\n"
            << "  --quiet               suppress log output\n";
}

}  // namespace

int main(int argc, char** argv) {
  Args args;
  try {
    args = parse_args(argc, argv);
  } catch (const std::exception& e) {
    args.error = std::string("bad argument value: ") + e.what();
  }
  if (args.help) {
    print_usage();
    return 0;
  }
  if (!args.error.empty()) {
    std::cerr << args.error << "\n";
    print_usage();
    return 2;
  }

  reel::Config cfg;
  if (!args.config_path.empty()) {
    auto cfg_r = reel::load_config(args.config_path);
    if (!cfg_r.ok()) {
      std::cerr << cfg_r.status().to_string() << "\n";
      return 1;
    }
    cfg = cfg_r.take_value();
  }
  if (!args.out_dir.empty()) cfg.output.out_dir = args.out_dir;

  if (args.quiet) reel::Logger::SetQuiet(true);

  std::vector<reel::EventRecord> guided;
  if (!args.events_path.empty()) {
    auto ev_r = reel::load_event_records(args.events_path);
    if (!ev_r.ok()) {
      std::cerr << ev_r.status().to_string() << "\n";
      return 2;
    }
    guided = ev_r.take_value();
  }

  std::unique_ptr<reel::ISignalSource> source;
  if (args.synth) {
    reel::SynthSignalSourceConfig sc;
    sc.seed = args.seed;
    if (cfg.match.video_duration_s) sc.duration_s = *cfg.match.video_duration_s;
    source = std::make_unique<reel::SynthSignalSource>(sc);
  } else if (!args.signals_path.empty()) {
    source = std::make_unique<reel::SignalsFileSource>(reel::SignalsFileSourceConfig{args.signals_path});
  }

  reel::EdlRunner runner(cfg, args.config_path);
  reel::JsonlManifestSink sink;

  const reel::Status st_start = runner.start(sink);
  if (!st_start.ok()) {
    std::cerr << st_start.to_string() << "\n";
    return 2;
  }

  // Ensure we always close/flush cleanly.
  struct Guard {
    reel::EdlRunner& r;
    reel::JsonlManifestSink& s;
    ~Guard() { r.stop(s); }
  } guard{runner, sink};

  auto report_r = runner.run(sink, source.get(), guided, args.kickoff_s);
  if (!report_r.ok()) {
    std::cerr << report_r.status().to_string() << "\n";
    return 2;
  }
  const reel::RunReport& report = *report_r;

  std::cout << "\nEDL: " << report.events.size() << " clips (guided loaded "
            << report.summary.guided_loaded << ", auto added " << report.summary.auto_added
            << ", fused " << report.summary.fused << ")\n";
  int idx = 1;
  for (const auto& e : report.events) {
    char line[160];
    std::snprintf(line, sizeof(line), "  %2d. %-10s %s  %5.1fs  conf %.2f  %s", idx++,
                  e.type.c_str(), reel::seconds_to_timestamp(e.abs_ts).c_str(), e.duration(),
                  e.confidence, reel::to_string(e.source()));
    std::cout << line << "\n";
  }
  std::cout << "Manifest: " << sink.path() << " (latest: " << sink.latest_path() << ")\n";
  return 0;
}
