/**
 * @file test_scheduler.cpp
 * @brief Bounded pipeline pool: accounting, retries, interrupts
 */

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "chunk_encode/scheduler.hpp"

using namespace chunk_encode;

namespace {

PipelineJob shell_job(int id, const std::string &encode) {
  PipelineJob job;
  job.chunk_id = id;
  job.frames = 24;
  job.decode_argv = {"sh", "-c", "printf payload"};
  job.encode_argv = {"sh", "-c", encode};
  return job;
}

std::string temp_path(const std::string &name) {
  return ::testing::TempDir() + name;
}

} // anonymous namespace

TEST(Scheduler, CompletesEveryJob) {
  ProcessRegistry registry;
  CancellationToken token;
  RunContext context{registry, token, 24.0, 24 * 6};
  ExecutionScheduler scheduler(context);

  std::vector<PipelineJob> jobs;
  for (int id = 1; id <= 6; ++id) {
    PipelineJob job = shell_job(id, "");
    job.output_path = temp_path("sched_chunk_" + std::to_string(id));
    job.encode_argv[2] = "cat > '" + job.output_path + "'";
    jobs.push_back(job);
  }

  CompletionReport report = scheduler.run_all(jobs, 3);
  EXPECT_TRUE(report.ok());
  ASSERT_EQ(report.completed.size(), 6u);
  std::vector<int> ids = report.completed;
  std::sort(ids.begin(), ids.end());
  for (int i = 0; i < 6; ++i)
    EXPECT_EQ(ids[i], i + 1);

  /// 6 chunks of 7 bytes over 6 seconds
  EXPECT_NEAR(report.average_bitrate_kbps, 7.0 / 1024.0 * 8.0, 1e-9);
  EXPECT_GT(report.estimated_size_mb, 0.0);
  EXPECT_EQ(registry.size(), 0u);

  for (const auto &job : jobs)
    std::remove(job.output_path.c_str());
}

TEST(Scheduler, RetriesOnceBeforeFailing) {
  ProcessRegistry registry;
  CancellationToken token;
  RunContext context{registry, token, 24.0, 48};
  ExecutionScheduler scheduler(context);

  const std::string flag = temp_path("sched_retry_flag");
  std::remove(flag.c_str());

  std::vector<PipelineJob> jobs{
      shell_job(1, "cat > /dev/null; if [ -e '" + flag +
                       "' ]; then exit 0; fi; touch '" + flag + "'; exit 4"),
      shell_job(2, "cat > /dev/null; exit 5")};

  CompletionReport report = scheduler.run_all(jobs, 2);
  EXPECT_FALSE(report.ok());
  ASSERT_EQ(report.completed.size(), 1u);
  EXPECT_EQ(report.completed[0], 1);
  ASSERT_EQ(report.failed.size(), 1u);
  EXPECT_EQ(report.failed[0].first, 2);
  EXPECT_EQ(report.failed[0].second, 5);
  EXPECT_FALSE(report.interrupted);

  std::remove(flag.c_str());
}

TEST(Scheduler, CancelledBeforeStartDiscardsEverything) {
  ProcessRegistry registry;
  CancellationToken token;
  token.cancel();
  RunContext context{registry, token, 24.0, 48};
  ExecutionScheduler scheduler(context);

  std::vector<PipelineJob> jobs{shell_job(1, "cat"), shell_job(2, "cat"),
                                shell_job(3, "cat")};
  CompletionReport report = scheduler.run_all(jobs, 1);
  EXPECT_TRUE(report.interrupted);
  EXPECT_EQ(report.discarded, 3);
  EXPECT_TRUE(report.completed.empty());
  EXPECT_TRUE(report.failed.empty());
}

TEST(Scheduler, InterruptTerminatesRunningPipelines) {
  ProcessRegistry registry;
  CancellationToken token;
  RunContext context{registry, token, 24.0, 96};
  context.terminate_timeout_sec = 2;
  ExecutionScheduler scheduler(context);

  std::vector<PipelineJob> jobs;
  for (int id = 1; id <= 4; ++id)
    jobs.push_back(shell_job(id, "cat > /dev/null; sleep 30"));

  std::thread interrupter([&token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    token.cancel();
  });

  auto start = std::chrono::steady_clock::now();
  CompletionReport report = scheduler.run_all(jobs, 2);
  interrupter.join();
  double seconds = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - start)
                       .count();

  EXPECT_TRUE(report.interrupted);
  EXPECT_TRUE(report.completed.empty());
  EXPECT_TRUE(report.failed.empty());
  EXPECT_EQ(report.discarded, 2);
  EXPECT_LT(seconds, 20.0);
  EXPECT_EQ(registry.size(), 0u);
}

TEST(Scheduler, InterruptKillsPipelinesIgnoringSigterm) {
  ProcessRegistry registry;
  CancellationToken token;
  RunContext context{registry, token, 24.0, 72};
  context.terminate_timeout_sec = 1;
  ExecutionScheduler scheduler(context);

  std::vector<PipelineJob> jobs;
  for (int id = 1; id <= 3; ++id) {
    PipelineJob job = shell_job(id, "trap '' TERM; cat > /dev/null; sleep 30");
    job.decode_argv[2] = "trap '' TERM; printf payload; sleep 30";
    jobs.push_back(job);
  }

  std::thread interrupter([&token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    token.cancel();
  });

  auto start = std::chrono::steady_clock::now();
  CompletionReport report = scheduler.run_all(jobs, 2);
  interrupter.join();
  double seconds = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - start)
                       .count();

  EXPECT_TRUE(report.interrupted);
  EXPECT_TRUE(report.completed.empty());
  EXPECT_TRUE(report.failed.empty());
  EXPECT_EQ(report.discarded, 1);
  EXPECT_LT(seconds, 10.0);
  EXPECT_EQ(registry.size(), 0u);
}

TEST(Scheduler, EmptyJobList) {
  ProcessRegistry registry;
  CancellationToken token;
  RunContext context{registry, token, 24.0, 0};
  ExecutionScheduler scheduler(context);
  CompletionReport report = scheduler.run_all({}, 4);
  EXPECT_TRUE(report.ok());
  EXPECT_TRUE(report.completed.empty());
}
