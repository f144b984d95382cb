// JSONL manifest sink.

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "reel/core/events/jsonl_manifest_sink.hpp"

namespace reel {
namespace {

namespace fs = std::filesystem;

fs::path MakeTempDir(const std::string& name) {
  const fs::path dir =
      fs::temp_directory_path() / ("reel_" + name + "_" + std::to_string(getpid()));
  fs::remove_all(dir);
  return dir;
}

std::vector<std::string> ReadLines(const std::string& path) {
  std::ifstream f(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(f, line);) lines.push_back(line);
  return lines;
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

RunInfo MakeRun(const fs::path& out_dir) {
  RunInfo run;
  run.run_id = "20261019_120000";
  run.match_id = "derby";
  run.config_path = "config/default.yaml";
  run.out_dir = out_dir.string();
  run.config_hash = "00000000deadbeef";
  run.wall_start_ns = 123;
  return run;
}

TEST(JsonlManifestSinkTest, WritesRunAndLatestFiles) {
  const fs::path dir = MakeTempDir("sink");
  JsonlManifestSink sink;
  ASSERT_TRUE(sink.open(MakeRun(dir)).ok());
  EXPECT_EQ(fs::path(sink.path()).filename().string(), "manifest_123.jsonl");
  EXPECT_EQ(fs::path(sink.latest_path()).filename().string(), "manifest_latest.jsonl");

  ManifestEntry e;
  e.id = "g1";
  e.type = "goal";
  e.timestamp = "00:05:00.000";
  e.abs_ts = 300.0;
  e.clip_start = 293.0;
  e.clip_end = 310.0;
  e.duration = 17.0;
  e.minute = 5;
  e.team = "home";
  e.score = MatchScore{1, 0};
  e.confidence = 1.0;
  e.replay_enabled = true;
  e.signals = {"celebration"};

  ASSERT_TRUE(sink.emit(e).ok());
  ASSERT_TRUE(sink.emit_warning("2 guided events have no kickoff reference").ok());

  RunSummary summary;
  summary.guided_loaded = 1;
  summary.final_events = 1;
  ASSERT_TRUE(sink.finish(summary).ok());
  sink.close();

  const auto lines = ReadLines(sink.path());
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_TRUE(Contains(lines[0], "\"type\":\"run_started\""));
  EXPECT_TRUE(Contains(lines[0], "\"match_id\":\"derby\""));
  EXPECT_TRUE(Contains(lines[0], "\"config_hash\":\"00000000deadbeef\""));

  EXPECT_TRUE(Contains(lines[1], "\"type\":\"clip\""));
  EXPECT_TRUE(Contains(lines[1], "\"event_type\":\"goal\""));
  EXPECT_TRUE(Contains(lines[1], "\"abs_ts\":300.000"));
  EXPECT_TRUE(Contains(lines[1], "\"minute\":5"));
  EXPECT_TRUE(Contains(lines[1], "\"team\":\"home\""));
  EXPECT_TRUE(Contains(lines[1], "\"player\":null"));
  EXPECT_TRUE(Contains(lines[1], "\"score\":{\"home\":1,\"away\":0}"));
  EXPECT_TRUE(Contains(lines[1], "\"source\":\"guided\""));
  EXPECT_TRUE(Contains(lines[1], "\"replay_enabled\":true"));
  EXPECT_TRUE(Contains(lines[1], "\"signals\":[\"celebration\"]"));

  EXPECT_TRUE(Contains(lines[2], "\"type\":\"warning\""));
  EXPECT_TRUE(Contains(lines[3], "\"type\":\"run_finished\""));
  EXPECT_TRUE(Contains(lines[3], "\"final_events\":1"));

  EXPECT_EQ(ReadLines(sink.latest_path()), lines);
  fs::remove_all(dir);
}

TEST(JsonlManifestSinkTest, RejectsWritesWhenClosed) {
  JsonlManifestSink sink;
  EXPECT_EQ(sink.emit(ManifestEntry{}).code(), Status::Code::kInvalidArgument);
  EXPECT_EQ(sink.emit_warning("x").code(), Status::Code::kInvalidArgument);
  EXPECT_EQ(sink.finish(RunSummary{}).code(), Status::Code::kInvalidArgument);
  EXPECT_TRUE(sink.flush().ok());
}

TEST(JsonlManifestSinkTest, QuotesJsonStrings) {
  EXPECT_EQ(json_quote("plain"), "\"plain\"");
  EXPECT_EQ(json_quote("a\"b\\c"), "\"a\\\"b\\\\c\"");
  EXPECT_EQ(json_quote("line\nnext\t"), "\"line\\nnext\\t\"");
  EXPECT_EQ(json_quote(std::string("\x01", 1)), "\"\\u0001\"");
}

}  // namespace
}  // namespace reel
