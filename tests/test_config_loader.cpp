// Config loading, layering, validation and fingerprinting.

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "reel/core/util/config_loader.hpp"
#include "reel/core/util/repro_hash.hpp"

namespace reel {
namespace {

namespace fs = std::filesystem;

fs::path MakeTempDir(const std::string& name) {
  const fs::path dir =
      fs::temp_directory_path() / ("reel_" + name + "_" + std::to_string(getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void WriteFile(const fs::path& p, const std::string& text) {
  std::ofstream f(p);
  f << text;
}

TEST(ConfigLoaderTest, EmptyDocumentGivesDefaults) {
  auto r = load_config_from_string("");
  ASSERT_TRUE(r.ok()) << r.status().to_string();
  const Config& c = *r;
  EXPECT_EQ(c.match_id, "unknown_match");
  EXPECT_DOUBLE_EQ(c.detection.bucket_size, 1.0);
  EXPECT_DOUBLE_EQ(c.detection.min_confidence, 0.3);
  EXPECT_DOUBLE_EQ(c.detection.dedupe_window_s, 4.0);
  EXPECT_DOUBLE_EQ(c.detection.promotion_margin, 0.15);
  EXPECT_DOUBLE_EQ(c.detection.weight_for("json"), 5.0);
  EXPECT_DOUBLE_EQ(c.detection.weight_for("crowd_noise"), 1.0);
  EXPECT_EQ(c.limits.max_clips, 20);
  EXPECT_DOUBLE_EQ(c.padding.default_window.pre, 7.0);
  EXPECT_DOUBLE_EQ(c.padding.default_window.post, 10.0);
  EXPECT_FALSE(c.padding.save.pre.has_value());
  EXPECT_TRUE(c.zoom.enable);
  EXPECT_TRUE(c.replay.enable_for.empty());
  EXPECT_FALSE(c.match.kickoff_s.has_value());
  EXPECT_DOUBLE_EQ(c.match.first_half_duration_s, 2940.0);
  EXPECT_EQ(c.output.out_dir, "out");
}

TEST(ConfigLoaderTest, OverridesMergeWithDefaults) {
  auto r = load_config_from_string(R"(
match_id: derby
detection:
  weights: {audio: 2.0, crowd: 0.7}
  dedupe_window_s: 6
limits:
  max_clips: 12
padding:
  save: {pre: 4}
  goal: {pre_bonus_on_attack: 3, post_bonus_on_celebration: 5}
zoom:
  enable: false
replay:
  enable_for: [goal, big_save]
match:
  kickoff_s: 95.5
)");
  ASSERT_TRUE(r.ok()) << r.status().to_string();
  const Config& c = *r;
  EXPECT_EQ(c.match_id, "derby");
  EXPECT_DOUBLE_EQ(c.detection.weight_for("audio"), 2.0);
  EXPECT_DOUBLE_EQ(c.detection.weight_for("crowd"), 0.7);
  EXPECT_DOUBLE_EQ(c.detection.weight_for("yolo"), 2.0);
  EXPECT_DOUBLE_EQ(c.detection.dedupe_window_s, 6.0);
  EXPECT_EQ(c.limits.max_clips, 12);
  ASSERT_TRUE(c.padding.save.pre.has_value());
  EXPECT_DOUBLE_EQ(*c.padding.save.pre, 4.0);
  EXPECT_FALSE(c.padding.save.post.has_value());
  EXPECT_DOUBLE_EQ(c.padding.goal_pre_bonus_on_attack, 3.0);
  EXPECT_DOUBLE_EQ(c.padding.goal_post_bonus_on_celebration, 5.0);
  EXPECT_FALSE(c.zoom.enable);
  ASSERT_EQ(c.replay.enable_for.size(), 2u);
  EXPECT_EQ(c.replay.enable_for[1], "big_save");
  ASSERT_TRUE(c.match.kickoff_s.has_value());
  EXPECT_DOUBLE_EQ(*c.match.kickoff_s, 95.5);
}

TEST(ConfigLoaderTest, RejectsInvalidValues) {
  auto bucket = load_config_from_string("detection: {bucket_size: 0}");
  ASSERT_FALSE(bucket.ok());
  EXPECT_EQ(bucket.status().code(), Status::Code::kInvalidArgument);

  auto conf = load_config_from_string("detection: {min_confidence: 1.5}");
  EXPECT_FALSE(conf.ok());

  auto weight = load_config_from_string("detection: {weights: {audio: -1}}");
  EXPECT_FALSE(weight.ok());

  auto lengths = load_config_from_string("limits: {min_clip_len_s: 40, max_clip_len_s: 30}");
  EXPECT_FALSE(lengths.ok());

  auto clips = load_config_from_string("limits: {max_clips: 0}");
  EXPECT_FALSE(clips.ok());

  auto replay = load_config_from_string("replay: {enable_for: goal}");
  EXPECT_FALSE(replay.ok());
}

TEST(ConfigLoaderTest, WrongTypeIsParseError) {
  auto r = load_config_from_string("limits: {max_clips: lots}");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kParseError);

  auto syntax = load_config_from_string("detection: [unclosed");
  ASSERT_FALSE(syntax.ok());
  EXPECT_EQ(syntax.status().code(), Status::Code::kParseError);
}

TEST(ConfigLoaderTest, IncludesAreLayered) {
  const fs::path dir = MakeTempDir("cfg_includes");
  fs::create_directories(dir / "base");
  WriteFile(dir / "base" / "limits.yaml", "limits: {max_clips: 5, max_clip_len_s: 25}\n"
                                          "padding: {default: {pre: 4, post: 8}}\n");
  WriteFile(dir / "match.yaml", "includes: [base/limits.yaml]\n"
                                "limits: {max_clips: 8}\n"
                                "padding: {default: {post: 9}}\n");

  auto r = load_config((dir / "match.yaml").string());
  ASSERT_TRUE(r.ok()) << r.status().to_string();
  EXPECT_EQ(r->limits.max_clips, 8);
  EXPECT_DOUBLE_EQ(r->limits.max_clip_len_s, 25.0);
  EXPECT_DOUBLE_EQ(r->padding.default_window.pre, 4.0);
  EXPECT_DOUBLE_EQ(r->padding.default_window.post, 9.0);

  fs::remove_all(dir);
}

TEST(ConfigLoaderTest, MissingFileAndMissingInclude) {
  auto missing = load_config("/nonexistent/reel/config.yaml");
  ASSERT_FALSE(missing.ok());
  EXPECT_EQ(missing.status().code(), Status::Code::kNotFound);

  const fs::path dir = MakeTempDir("cfg_missing_include");
  WriteFile(dir / "main.yaml", "includes: [nope.yaml]\n");
  auto r = load_config((dir / "main.yaml").string());
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kNotFound);
  fs::remove_all(dir);
}

TEST(ConfigLoaderTest, IncludesMustBeASequence) {
  const fs::path dir = MakeTempDir("cfg_bad_include");
  WriteFile(dir / "main.yaml", "includes: other.yaml\n");
  auto r = load_config((dir / "main.yaml").string());
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kInvalidArgument);
  fs::remove_all(dir);
}

TEST(ConfigHashTest, TracksTunablesOnly) {
  Config a;
  Config b;
  EXPECT_EQ(compute_config_hash(a), compute_config_hash(b));

  b.match_id = "other";
  b.output.out_dir = "elsewhere";
  EXPECT_EQ(compute_config_hash(a), compute_config_hash(b));

  b.detection.weights["audio"] = 1.6;
  EXPECT_NE(compute_config_hash(a), compute_config_hash(b));

  Config c;
  c.padding.save.pre = 4.0;
  EXPECT_NE(compute_config_hash(a), compute_config_hash(c));
}

}  // namespace
}  // namespace reel
