// End-to-end runs: signals -> fusion -> EDL -> manifest.

#include <gtest/gtest.h>
#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "reel/adapters/signals_file/signals_file_source.hpp"
#include "reel/adapters/synth/synth_signal_source.hpp"
#include "reel/core/events/jsonl_manifest_sink.hpp"
#include "reel/core/model/edl_runner.hpp"
#include "reel/core/util/log.hpp"

namespace reel {
namespace {

namespace fs = std::filesystem;

class EdlRunnerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::SetQuiet(true);
    dir_ = fs::temp_directory_path() /
           ("reel_runner_" + std::to_string(getpid()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir_);
    cfg_.output.out_dir = dir_.string();
  }

  void TearDown() override {
    fs::remove_all(dir_);
    Logger::SetQuiet(false);
  }

  static EventRecord GuidedGoal(Seconds abs_ts) {
    EventRecord r;
    r.id = "g1";
    r.type = "goal";
    r.abs_ts = EventRecord::TimeField{abs_ts};
    return r;
  }

  static std::size_t CountLines(const std::string& path) {
    std::ifstream f(path);
    std::size_t n = 0;
    for (std::string line; std::getline(f, line);) ++n;
    return n;
  }

  fs::path dir_;
  Config cfg_;
};

TEST_F(EdlRunnerTest, SynthAndGuidedProduceManifest) {
  SynthSignalSource synth(SynthSignalSourceConfig{});
  EdlRunner runner(cfg_, "");
  JsonlManifestSink sink;

  ASSERT_TRUE(runner.start(sink).ok());
  EXPECT_EQ(runner.run_id().size(), 15u);

  auto r = runner.run(sink, &synth, {GuidedGoal(300.0)});
  ASSERT_TRUE(r.ok()) << r.status().to_string();
  runner.stop(sink);

  const RunReport& report = *r;
  EXPECT_EQ(report.summary.guided_loaded, 1u);
  EXPECT_GT(report.summary.fused, 0u);
  EXPECT_EQ(report.summary.final_events, report.events.size());
  EXPECT_LE(report.events.size(), static_cast<std::size_t>(cfg_.limits.max_clips));

  const auto goal = std::find_if(report.events.begin(), report.events.end(), [](const Event& e) {
    return e.is_guided() && e.type == "goal";
  });
  ASSERT_NE(goal, report.events.end());
  EXPECT_DOUBLE_EQ(goal->abs_ts, 300.0);

  for (const auto& e : report.events) {
    EXPECT_GE(e.duration(), cfg_.limits.min_clip_len_s - 1e-9);
    EXPECT_LE(e.duration(), cfg_.limits.max_clip_len_s + 1e-9);
    EXPECT_TRUE(e.zoom_enabled);
  }

  EXPECT_EQ(CountLines(sink.path()), report.events.size() + report.warnings.size() + 2);
  EXPECT_TRUE(fs::exists(sink.latest_path()));
}

TEST_F(EdlRunnerTest, RunBeforeStartFails) {
  EdlRunner runner(cfg_, "");
  JsonlManifestSink sink;
  auto r = runner.run(sink, nullptr, {});
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kInvalidArgument);
}

TEST_F(EdlRunnerTest, FailedSourceAndBadGuidedBecomeWarnings) {
  SignalsFileSource missing(SignalsFileSourceConfig{(dir_ / "nope.json").string()});
  EventRecord bogus;
  bogus.type = "bogus";
  bogus.abs_ts = EventRecord::TimeField{10.0};

  EdlRunner runner(cfg_, "");
  JsonlManifestSink sink;
  ASSERT_TRUE(runner.start(sink).ok());
  auto r = runner.run(sink, &missing, {bogus});
  ASSERT_TRUE(r.ok()) << r.status().to_string();
  runner.stop(sink);

  EXPECT_TRUE(r->events.empty());
  ASSERT_EQ(r->warnings.size(), 2u);
  EXPECT_NE(r->warnings[0].find("signal source 'signals_file' failed"), std::string::npos);
  EXPECT_NE(r->warnings[1].find("guided events not loaded"), std::string::npos);
}

TEST_F(EdlRunnerTest, ClockEventsNeedAKickoff) {
  EventRecord clocked;
  clocked.type = "save";
  clocked.half = 1;
  clocked.clock = "20:00";

  {
    EdlRunner runner(cfg_, "");
    JsonlManifestSink sink;
    ASSERT_TRUE(runner.start(sink).ok());
    auto r = runner.run(sink, nullptr, {clocked});
    ASSERT_TRUE(r.ok());
    runner.stop(sink);
    EXPECT_TRUE(r->events.empty());
    EXPECT_EQ(r->summary.guided_deferred, 1u);
    EXPECT_EQ(r->summary.guided_loaded, 0u);
  }
  {
    EdlRunner runner(cfg_, "");
    JsonlManifestSink sink;
    ASSERT_TRUE(runner.start(sink).ok());
    auto r = runner.run(sink, nullptr, {clocked}, 30.0);
    ASSERT_TRUE(r.ok());
    runner.stop(sink);
    ASSERT_EQ(r->events.size(), 1u);
    EXPECT_DOUBLE_EQ(r->events[0].abs_ts, 1230.0);
    EXPECT_EQ(r->summary.guided_loaded, 1u);
    EXPECT_EQ(r->summary.guided_deferred, 0u);
  }
}

TEST_F(EdlRunnerTest, VideoDurationAddsTimingWarnings) {
  cfg_.match.video_duration_s = 305.0;
  EdlRunner runner(cfg_, "");
  JsonlManifestSink sink;
  ASSERT_TRUE(runner.start(sink).ok());
  auto r = runner.run(sink, nullptr, {GuidedGoal(300.0)});
  ASSERT_TRUE(r.ok());
  runner.stop(sink);

  ASSERT_EQ(r->warnings.size(), 1u);
  EXPECT_NE(r->warnings[0].find("clip ends after video"), std::string::npos);
}

TEST_F(EdlRunnerTest, PrunesOldManifests) {
  fs::create_directories(dir_);
  for (const char* name : {"manifest_1.jsonl", "manifest_2.jsonl", "manifest_3.jsonl", "notes.txt"}) {
    std::ofstream(dir_ / name) << "{}\n";
  }

  cfg_.output.keep_last = 2;
  EdlRunner runner(cfg_, "");
  JsonlManifestSink sink;
  ASSERT_TRUE(runner.start(sink).ok());
  runner.stop(sink);

  EXPECT_FALSE(fs::exists(dir_ / "manifest_1.jsonl"));
  EXPECT_FALSE(fs::exists(dir_ / "manifest_2.jsonl"));
  EXPECT_TRUE(fs::exists(dir_ / "manifest_3.jsonl"));
  EXPECT_TRUE(fs::exists(dir_ / "notes.txt"));
  EXPECT_TRUE(fs::exists(sink.path()));
  EXPECT_TRUE(fs::exists(dir_ / "manifest_latest.jsonl"));
}

}  // namespace
}  // namespace reel
