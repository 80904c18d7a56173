/**
 * @file test_cli.cpp
 * @brief Command-line parsing, validation and default resolution
 */

#include <cstdlib>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "chunk_encode/cli.hpp"
#include "chunk_encode/run_settings.hpp"
#include "chunk_encode/video_probe.hpp"

using namespace chunk_encode;

namespace {

struct ParseResult {
  CliStatus status;
  RunSettings settings;
  std::string error;
};

ParseResult parse(std::vector<std::string> args) {
  args.insert(args.begin(), "chunk_encode");
  std::vector<char *> argv;
  for (auto &a : args)
    argv.push_back(&a[0]);
  argv.push_back(nullptr);

  ParseResult result;
  result.status = parse_command_line(static_cast<int>(args.size()),
                                     argv.data(), result.settings,
                                     result.error);
  return result;
}

VideoInfo hd_source() {
  VideoInfo info;
  info.width = 1920;
  info.height = 1080;
  info.frame_count = 3000;
  info.fps = 24.0;
  info.fps_ceil = 24;
  return info;
}

} // anonymous namespace

// **----- PARSING -----**

TEST(CommandLine, MinimalRun) {
  auto r = parse({"movie.mkv", "--scenes", "scenes.json"});
  ASSERT_EQ(r.status, CliStatus::Run) << r.error;
  EXPECT_EQ(r.settings.source, "movie.mkv");
  EXPECT_EQ(r.settings.scenes_path, "scenes.json");
  EXPECT_EQ(r.settings.encoder, EncoderFamily::Svt);
  EXPECT_FALSE(r.settings.qadjust);
}

TEST(CommandLine, FullQadjustRun) {
  auto r = parse({"--scenes", "s.txt", "--encoder", "svt", "--preset", "4",
                  "--q", "24.5", "--qadjust", "--qadjust-mode", "3",
                  "--qadjust-target", "0.95", "--qadjust-workers", "2,0",
                  "--min-q", "12", "--max-q", "40", "--probe-count", "6",
                  "--credits-start-frame", "2800", "movie.mkv"});
  ASSERT_EQ(r.status, CliStatus::Run) << r.error;
  EXPECT_EQ(r.settings.preset, "4");
  EXPECT_DOUBLE_EQ(r.settings.q, 24.5);
  EXPECT_EQ(r.settings.qadjust_mode, QAdjustMode::ProbeCurve);
  EXPECT_TRUE(r.settings.has_target);
  EXPECT_DOUBLE_EQ(r.settings.target, 0.95);
  EXPECT_EQ(r.settings.metric_workers, 2);
  EXPECT_EQ(r.settings.metric_threads, 1);
  EXPECT_EQ(r.settings.probe_count, 6);
  EXPECT_EQ(r.settings.credits_start, 2800);
}

TEST(CommandLine, ReuseImpliesQadjust) {
  auto r = parse({"movie.mkv", "--scenes", "s.json", "--qadjust-reuse"});
  ASSERT_EQ(r.status, CliStatus::Run) << r.error;
  EXPECT_TRUE(r.settings.qadjust);
  EXPECT_TRUE(r.settings.qadjust_reuse);
}

TEST(CommandLine, Help) {
  EXPECT_EQ(parse({"--help"}).status, CliStatus::Help);
  EXPECT_EQ(parse({"-h"}).status, CliStatus::Help);
  EXPECT_NE(usage_text("chunk_encode").find("--qadjust-mode"),
            std::string::npos);
}

TEST(CommandLine, RejectsBadArguments) {
  EXPECT_EQ(parse({"--scenes", "s.json"}).status, CliStatus::Error);
  EXPECT_EQ(parse({"a.mkv", "b.mkv", "--scenes", "s.json"}).status,
            CliStatus::Error);
  EXPECT_EQ(parse({"a.mkv"}).status, CliStatus::Error);
  EXPECT_EQ(parse({"a.mkv", "--scenes", "s", "--bogus"}).status,
            CliStatus::Error);
  EXPECT_EQ(parse({"a.mkv", "--scenes", "s", "--encoder", "vp9"}).status,
            CliStatus::Error);
  EXPECT_EQ(parse({"a.mkv", "--scenes", "s", "--threads", "four"}).status,
            CliStatus::Error);
  EXPECT_EQ(parse({"a.mkv", "--scenes", "s", "--qadjust-mode", "4"}).status,
            CliStatus::Error);
  EXPECT_EQ(parse({"a.mkv", "--scenes", "s", "--qadjust-workers", "2"}).status,
            CliStatus::Error);
  EXPECT_EQ(parse({"a.mkv", "--scenes"}).status, CliStatus::Error);
}

TEST(CommandLine, ErrorNamesTheOption) {
  auto r = parse({"a.mkv", "--scenes", "s", "--min-chunk-length", "x"});
  ASSERT_EQ(r.status, CliStatus::Error);
  EXPECT_NE(r.error.find("min-chunk-length"), std::string::npos);
}

// **----- VALIDATION -----**

TEST(Validation, Ranges) {
  EXPECT_EQ(parse({"a.mkv", "--scenes", "s", "--q", "70"}).status,
            CliStatus::Error);
  EXPECT_EQ(parse({"a.mkv", "--scenes", "s", "--encoder", "rav1e", "--q",
                   "200"})
                .status,
            CliStatus::Run);
  EXPECT_EQ(parse({"a.mkv", "--scenes", "s", "--preset", "13"}).status,
            CliStatus::Error);
  EXPECT_EQ(parse({"a.mkv", "--scenes", "s", "--preset", "slow"}).status,
            CliStatus::Error);
  EXPECT_EQ(parse({"a.mkv", "--scenes", "s", "--encoder", "x265", "--preset",
                   "slow"})
                .status,
            CliStatus::Run);
  EXPECT_EQ(parse({"a.mkv", "--scenes", "s", "--min-chunk-length", "4"}).status,
            CliStatus::Error);
  EXPECT_EQ(parse({"a.mkv", "--scenes", "s", "--min-q", "30", "--max-q", "20"})
                .status,
            CliStatus::Error);
}

TEST(Validation, QadjustModeRules) {
  auto linear_x265 = parse({"a.mkv", "--scenes", "s", "--encoder", "x265",
                            "--qadjust", "--qadjust-mode", "2",
                            "--qadjust-target", "1.5"});
  EXPECT_EQ(linear_x265.status, CliStatus::Error);

  auto no_target =
      parse({"a.mkv", "--scenes", "s", "--qadjust", "--qadjust-mode", "2"});
  EXPECT_EQ(no_target.status, CliStatus::Error);

  auto reuse = parse({"a.mkv", "--scenes", "s", "--qadjust-reuse",
                      "--qadjust-mode", "2"});
  EXPECT_EQ(reuse.status, CliStatus::Run) << reuse.error;

  auto aom = parse({"a.mkv", "--scenes", "s", "--encoder", "aom", "--qadjust"});
  ASSERT_EQ(aom.status, CliStatus::Run) << aom.error;
  EXPECT_EQ(aom.settings.encoder, EncoderFamily::Svt);
}

TEST(Validation, ListParametersNeedsNoScenes) {
  auto r = parse({"a.mkv", "--list-parameters"});
  ASSERT_EQ(r.status, CliStatus::Run) << r.error;
  EXPECT_TRUE(r.settings.list_parameters);
}

TEST(WorkerSpec, Parsing) {
  int w = 0, t = 0;
  EXPECT_TRUE(parse_worker_spec("3,8", w, t));
  EXPECT_EQ(w, 3);
  EXPECT_EQ(t, 8);
  EXPECT_FALSE(parse_worker_spec("0,2", w, t));
  EXPECT_FALSE(parse_worker_spec("2;2", w, t));
  EXPECT_FALSE(parse_worker_spec("2,x", w, t));
}

// **----- DEFAULTS -----**

TEST(ResolveSettings, SvtDefaults) {
  auto r = parse({"a.mkv", "--scenes", "s", "--preset", "6", "--qadjust",
                  "--qadjust-workers", "2,2", "--metric-command", "true"});
  ASSERT_EQ(r.status, CliStatus::Run) << r.error;

  std::string error;
  ASSERT_TRUE(resolve_settings(r.settings, hd_source(), error)) << error;
  EXPECT_DOUBLE_EQ(r.settings.q, 18.0);
  EXPECT_DOUBLE_EQ(r.settings.credits_q, 40.0);
  EXPECT_EQ(r.settings.credits_cpu, 8);
  EXPECT_EQ(r.settings.threads, 4);
  EXPECT_EQ(r.settings.min_chunk_length, 64);
  EXPECT_EQ(r.settings.keyint, 256);
  EXPECT_EQ(r.settings.qadjust_skip, 3);
  EXPECT_DOUBLE_EQ(r.settings.min_q, 10.0);
  EXPECT_DOUBLE_EQ(r.settings.max_q, 50.0);
  EXPECT_EQ(r.settings.probe_window, 48);
  EXPECT_LT(r.settings.luma_min, r.settings.luma_max);
  EXPECT_GT(r.settings.terminate_timeout_sec, 0);
}

TEST(ResolveSettings, X265Defaults) {
  auto r = parse({"a.mkv", "--scenes", "s", "--encoder", "x265", "--q", "20"});
  ASSERT_EQ(r.status, CliStatus::Run) << r.error;

  VideoInfo info = hd_source();
  info.width = 1280;
  info.height = 720;

  std::string error;
  ASSERT_TRUE(resolve_settings(r.settings, info, error)) << error;
  EXPECT_EQ(r.settings.preset, "slow");
  EXPECT_DOUBLE_EQ(r.settings.credits_q, 28.0);
  EXPECT_EQ(r.settings.threads, 6);
  EXPECT_EQ(r.settings.min_chunk_length, 48);
  EXPECT_EQ(r.settings.keyint, 240);
  EXPECT_EQ(r.settings.qadjust_skip, 1);
}

TEST(ResolveSettings, CreditsAtTheEndAreRejected) {
  auto r = parse({"a.mkv", "--scenes", "s", "--credits-start-frame", "2999"});
  ASSERT_EQ(r.status, CliStatus::Run) << r.error;
  std::string error;
  EXPECT_FALSE(resolve_settings(r.settings, hd_source(), error));
  EXPECT_FALSE(error.empty());
}

TEST(ResolveSettings, MalformedEnvironmentIsAnError) {
  auto r = parse({"a.mkv", "--scenes", "s"});
  ASSERT_EQ(r.status, CliStatus::Run) << r.error;

  ::setenv("MAX_PARALLEL_ENCODES", "abc", 1);
  std::string error;
  const bool ok = resolve_settings(r.settings, hd_source(), error);
  ::unsetenv("MAX_PARALLEL_ENCODES");

  EXPECT_FALSE(ok);
  EXPECT_NE(error.find("MAX_PARALLEL_ENCODES"), std::string::npos) << error;
}

TEST(ResolveSettings, TrailingGarbageInEnvironmentIsAnError) {
  auto r = parse({"a.mkv", "--scenes", "s"});
  ASSERT_EQ(r.status, CliStatus::Run) << r.error;

  ::setenv("LUMA_MIN", "0.1x", 1);
  std::string error;
  const bool ok = resolve_settings(r.settings, hd_source(), error);
  ::unsetenv("LUMA_MIN");

  EXPECT_FALSE(ok);
  EXPECT_NE(error.find("LUMA_MIN"), std::string::npos) << error;
}
