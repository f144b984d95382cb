// File: src/core/events/jsonl_manifest_sink.cpp
#include "reel/core/events/jsonl_manifest_sink.hpp"

#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

namespace reel {
namespace {

std::string join_path(const std::string& a, const std::string& b) {
  namespace fs = std::filesystem;
  return (fs::path(a) / fs::path(b)).string();
}

void put_opt(std::ostringstream& ss, const char* key, const std::optional<std::string>& v) {
  ss << ",\"" << key << "\":";
  if (v) ss << json_quote(*v);
  else ss << "null";
}

}  // namespace

std::string json_quote(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('"');
  return out;
}

JsonlManifestSink::~JsonlManifestSink() { close(); }

Status JsonlManifestSink::open(const RunInfo& run) {
  close();

  std::error_code ec;
  std::filesystem::create_directories(run.out_dir, ec);
  if (ec) {
    return Status::io_error("failed creating out_dir '" + run.out_dir + "': " + ec.message());
  }

  path_ = join_path(run.out_dir, "manifest_" + std::to_string(run.wall_start_ns) + ".jsonl");
  latest_path_ = join_path(run.out_dir, "manifest_latest.jsonl");

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  latest_.open(latest_path_, std::ios::out | std::ios::trunc);
  if (!latest_.is_open()) return Status::io_error("failed opening '" + latest_path_ + "'");

  open_ = true;

  // Run header line (written to BOTH files).
  std::ostringstream ss;
  ss << "{"
     << "\"type\":\"run_started\","
     << "\"run_id\":" << json_quote(run.run_id) << ","
     << "\"match_id\":" << json_quote(run.match_id) << ","
     << "\"t_wall_ns\":" << run.wall_start_ns << ","
     << "\"config_path\":" << json_quote(run.config_path) << ","
     << "\"config_hash\":" << json_quote(run.config_hash)
     << "}";

  REEL_RETURN_IF_ERROR(write_line_(ss.str()));
  return flush();
}

std::string JsonlManifestSink::to_json(const ManifestEntry& e) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(3);

  ss << "{"
     << "\"type\":\"clip\","
     << "\"id\":" << json_quote(e.id) << ","
     << "\"event_type\":" << json_quote(e.type) << ","
     << "\"timestamp\":" << json_quote(e.timestamp) << ","
     << "\"abs_ts\":" << e.abs_ts << ","
     << "\"clip_start\":" << e.clip_start << ","
     << "\"clip_end\":" << e.clip_end << ","
     << "\"duration\":" << e.duration;

  ss << ",\"minute\":";
  if (e.minute) ss << *e.minute;
  else ss << "null";

  put_opt(ss, "team", e.team);
  put_opt(ss, "player", e.player);
  put_opt(ss, "assist", e.assist);

  ss << ",\"score\":";
  if (e.score) ss << "{\"home\":" << e.score->home << ",\"away\":" << e.score->away << "}";
  else ss << "null";

  put_opt(ss, "notes", e.notes);

  ss << ",\"confidence\":" << e.confidence
     << ",\"source\":\"" << to_string(e.source) << "\""
     << ",\"zoom_enabled\":" << (e.zoom_enabled ? "true" : "false")
     << ",\"replay_enabled\":" << (e.replay_enabled ? "true" : "false")
     << ",\"signals\":[";
  for (std::size_t i = 0; i < e.signals.size(); ++i) {
    if (i > 0) ss << ",";
    ss << json_quote(e.signals[i]);
  }
  ss << "]}";
  return ss.str();
}

Status JsonlManifestSink::emit(const ManifestEntry& e) {
  if (!open_) return Status::invalid_argument("JsonlManifestSink::emit called while not open");
  return write_line_(to_json(e));
}

Status JsonlManifestSink::emit_warning(const std::string& message) {
  if (!open_) return Status::invalid_argument("JsonlManifestSink::emit_warning called while not open");
  return write_line_("{\"type\":\"warning\",\"message\":" + json_quote(message) + "}");
}

Status JsonlManifestSink::finish(const RunSummary& s) {
  if (!open_) return Status::invalid_argument("JsonlManifestSink::finish called while not open");

  std::ostringstream ss;
  ss << "{"
     << "\"type\":\"run_finished\","
     << "\"guided_loaded\":" << s.guided_loaded << ","
     << "\"guided_deferred\":" << s.guided_deferred << ","
     << "\"fused\":" << s.fused << ","
     << "\"auto_added\":" << s.auto_added << ","
     << "\"final_events\":" << s.final_events
     << "}";

  REEL_RETURN_IF_ERROR(write_line_(ss.str()));
  return flush();
}

Status JsonlManifestSink::write_line_(const std::string& line) {
  f_ << line << "\n";
  latest_ << line << "\n";

  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed writing to '" + latest_path_ + "'");

  return Status{};
}

Status JsonlManifestSink::flush() {
  if (!open_) return Status{};

  f_.flush();
  latest_.flush();

  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed flushing '" + latest_path_ + "'");

  return Status{};
}

void JsonlManifestSink::close() {
  if (f_.is_open()) f_.close();
  if (latest_.is_open()) latest_.close();
  open_ = false;
}

}  // namespace reel
