/**
 * @file orchestrator.cpp
 * @brief Run orchestration implementation
 */

#include "chunk_encode/orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "chunk_encode/chunk_planner.hpp"
#include "chunk_encode/concat.hpp"
#include "chunk_encode/logging.hpp"
#include "chunk_encode/scene_changes.hpp"
#include "chunk_encode/system.hpp"

namespace chunk_encode {

namespace fs = std::filesystem;

namespace {

/// Sum of non-credits chunk lengths
int regular_frames(const std::vector<Chunk> &chunks) {
  int total = 0;
  for (const auto &c : chunks)
    if (!c.is_credits)
      total += c.length;
  return total;
}

void log_distribution(const std::vector<Chunk> &chunks) {
  for (const auto &line : format_quantizer_distribution(chunks))
    LOG_INFO("{}", line);
}

} // anonymous namespace

std::vector<Chunk> with_quantizer(const std::vector<Chunk> &chunks, double q) {
  std::vector<Chunk> out = chunks;
  for (auto &c : out)
    if (!c.is_credits)
      c.quantizer = q;
  return out;
}

// **---- Constructor ----**

Orchestrator::Orchestrator(RunSettings settings)
    : settings_(std::move(settings)) {}

// **---- Setup ----**

int Orchestrator::prepare() {
  TIMER_START(probe);
  {
    VideoProbe probe(settings_.source);
    if (!probe.initialize()) {
      LOG_ERROR("Failed to probe source: {}", settings_.source);
      return EXIT_CONFIG_ERROR;
    }
    info_ = probe.info();
  }
  TIMER_END(probe);

  if (info_.frame_count <= 0 || info_.fps <= 0.0) {
    LOG_ERROR("Source reports no frames or no frame rate: {}",
              settings_.source);
    return EXIT_CONFIG_ERROR;
  }

  std::string error;
  if (!resolve_settings(settings_, info_, error)) {
    LOG_ERROR("{}", error);
    return EXIT_CONFIG_ERROR;
  }

  LOG_INFO("Source: {}x{}, {} frames @ {:.3f}fps ({}){}", info_.width,
           info_.height, info_.frame_count, info_.fps,
           format_time(info_.frame_count / info_.fps),
           info_.is_pq ? ", PQ" : "");
  return EXIT_OK;
}

int Orchestrator::plan() {
  TIMER_START(load_scenes);
  std::vector<int> scene_changes;
  if (!load_scene_changes(settings_.scenes_path, scene_changes)) {
    LOG_ERROR("Failed to load scene changes: {}", settings_.scenes_path);
    return EXIT_CONFIG_ERROR;
  }
  TIMER_END(load_scenes);

  plan_ = plan_chunks(scene_changes, info_.frame_count,
                      settings_.min_chunk_length, settings_.q,
                      settings_.credits_start, settings_.credits_q);
  if (plan_.by_id.empty()) {
    LOG_ERROR("Chunk plan is empty");
    return EXIT_CONFIG_ERROR;
  }

  LOG_INFO("Planned {} chunks from {} scene changes (minimum length {} "
           "frames)",
           plan_.by_id.size(), scene_changes.size(),
           settings_.min_chunk_length);
  return EXIT_OK;
}

int Orchestrator::setup_folders() {
  const std::string stem = fs::path(settings_.source).stem().string();
  const fs::path run_dir = fs::path(settings_.work_dir) / stem;

  output_dir_ = (run_dir / "output").string();
  chunks_dir_ = (run_dir / "chunks").string();
  logs_dir_ = (run_dir / "logs").string();
  record_path_ = (fs::path(output_dir_) / (stem + "_qadjust.json")).string();
  output_file_ = (fs::path(output_dir_) / (stem + ".mkv")).string();

  try {
    /// Chunks and logs of earlier runs are never reused
    fs::remove_all(chunks_dir_);
    fs::remove_all(logs_dir_);
    fs::create_directories(output_dir_);
    fs::create_directories(chunks_dir_);
    fs::create_directories(logs_dir_);
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to prepare folder {}: {}", run_dir.string(), e.what());
    return EXIT_CONFIG_ERROR;
  }

  const std::string log_path =
      (fs::path(output_dir_) / "encode_log.txt").string();
  if (!open_log_file(log_path))
    LOG_WARN("Cannot open run log {}", log_path);
  LOG_INFO("Process started.");
  return EXIT_OK;
}

// **---- Parameters ----**

EncoderParameters Orchestrator::final_parameters() const {
  EncoderParameters p;
  p.family = settings_.encoder;
  p.quantizer = settings_.q;
  p.preset = settings_.preset;
  p.threads = settings_.threads;
  p.keyint = settings_.keyint;
  p.extra = split_arguments(settings_.extra_params);
  return p;
}

EncoderParameters Orchestrator::analysis_parameters() const {
  return make_analysis_parameters(final_parameters(), settings_.qadjust_cpu);
}

std::string Orchestrator::credits_preset() const {
  if (settings_.credits_cpu == -100)
    return "";
  return std::to_string(settings_.credits_cpu);
}

int Orchestrator::final_preset_level() const {
  int level = 0;
  if (!preset_is_numeric(settings_.preset, level))
    return 0;
  return level;
}

RecordParameters Orchestrator::record_parameters() const {
  RecordParameters p;
  p.mode = settings_.qadjust_mode;
  p.encoder = settings_.encoder;
  p.min_chunk_length = settings_.min_chunk_length;
  p.keyint = settings_.keyint;
  p.base_q = settings_.q;
  p.target = settings_.target;
  p.analysis_preset = settings_.qadjust_cpu;
  p.skip = settings_.qadjust_skip;
  return p;
}

PipelineFactory Orchestrator::make_factory(const EncoderParameters &params,
                                           const std::string &tag) const {
  return PipelineFactory(settings_.source, chunks_dir_, logs_dir_, params,
                         credits_preset(), tag);
}

int Orchestrator::list_parameters() {
  Chunk sample;
  sample.id = 1;
  sample.start = 0;
  sample.end = std::max(0, info_.frame_count - 1);
  sample.length = info_.frame_count;
  sample.quantizer = settings_.q;

  const std::string out =
      fmt::format("encoded_chunk_1.{}", encoder_output_extension(settings_.encoder));

  fmt::print("The encoder parameters for the final encode: {}\n",
             join_argv(build_encode_argv(final_parameters(), out,
                                         sample.length)));
  if (settings_.qadjust) {
    fmt::print("The encoder parameters for the analysis: {}\n",
               join_argv(build_encode_argv(analysis_parameters(), out,
                                           sample.length)));
  }
  fmt::print("The decoder command: {}\n",
             join_argv(build_decode_argv(settings_.source, sample,
                                         settings_.encoder)));
  return EXIT_OK;
}

// **---- Passes ----**

int Orchestrator::encode_pass(const std::vector<Chunk> &chunks,
                              const PipelineFactory &factory,
                              bool skip_credits, CompletionReport &report) {
  if (token_.is_cancelled())
    return EXIT_INTERRUPTED;

  std::vector<PipelineJob> jobs = factory.make_jobs(chunks, skip_credits);

  RunContext context{registry_, token_};
  context.fps = info_.fps;
  context.timeline_frames =
      skip_credits ? regular_frames(chunks) : info_.frame_count;
  context.terminate_timeout_sec = settings_.terminate_timeout_sec;

  LOG_INFO("Encoding {} chunks, {} in parallel", jobs.size(),
           settings_.max_parallel);

  const int cpus = detect_cpu_limit();
  const int wanted = settings_.max_parallel * factory.parameters().threads;
  if (wanted > cpus) {
    LOG_WARN("{} encodes x {} threads exceeds the {} available CPUs",
             settings_.max_parallel, factory.parameters().threads, cpus);
  }

  ExecutionScheduler scheduler(context);
  report = scheduler.run_all(jobs, settings_.max_parallel);

  if (report.interrupted) {
    LOG_WARN("Encoding interrupted, {} chunks finished, {} not started",
             report.completed.size(), report.discarded);
    return EXIT_INTERRUPTED;
  }
  if (!report.failed.empty()) {
    for (const auto &f : report.failed)
      LOG_ERROR("Chunk {} failed with exit code {}", f.first, f.second);
    return EXIT_FAILED_CHUNKS;
  }

  LOG_SUCCESS("Pass finished in {}, average bitrate {:.2f} kbps",
              format_time(report.elapsed_sec), report.average_bitrate_kbps);
  return EXIT_OK;
}

int Orchestrator::score_pass(const std::vector<Chunk> &chunks,
                             const PipelineFactory &factory, MetricKind kind,
                             const MetricRunner::Aggregator &aggregate,
                             std::vector<ScoredChunk> &scores) {
  if (token_.is_cancelled())
    return EXIT_INTERRUPTED;

  std::vector<MetricRequest> requests;
  for (const auto &c : chunks) {
    if (c.is_credits)
      continue;
    MetricRequest r;
    r.chunk_id = c.id;
    r.start = c.start;
    r.end = c.end;
    r.distorted = factory.output_path(c.id);
    requests.push_back(r);
  }
  std::sort(requests.begin(), requests.end(),
            [](const MetricRequest &a, const MetricRequest &b) {
              return a.chunk_id < b.chunk_id;
            });

  LOG_INFO("Calculating {} for {} chunks ({} workers, {} threads, skip {})",
           metric_name(kind), requests.size(), settings_.metric_workers,
           settings_.metric_threads, settings_.qadjust_skip);

  CommandMetricEngine engine(settings_.metric_command, settings_.source, kind,
                             settings_.qadjust_skip, settings_.metric_threads);
  MetricRunner runner(engine, settings_.metric_workers, token_);
  if (!runner.run(requests, aggregate, scores)) {
    if (token_.is_cancelled())
      return EXIT_INTERRUPTED;
    LOG_ERROR("Metric evaluation failed");
    return EXIT_CONFIG_ERROR;
  }
  return EXIT_OK;
}

// **---- Quality Adjustment ----**

int Orchestrator::analyse_percentile(AdjustmentRecord &record) {
  LOG_PHASE("Running the analysis pass using your final CRF value.");
  PipelineFactory factory = make_factory(analysis_parameters(), "analysis_");
  LOG_INFO("The encoder parameters for the analysis: {}",
           join_argv(build_encode_argv(factory.parameters(), "-", 0)));

  std::vector<Chunk> chunks = with_quantizer(plan_.by_length, settings_.q);

  TIMER_START(analysis_pass);
  CompletionReport report;
  int status = encode_pass(chunks, factory, true, report);
  TIMER_END(analysis_pass);
  if (status != EXIT_OK)
    return status;

  TIMER_START(metrics);
  std::vector<ScoredChunk> scores;
  status = score_pass(chunks, factory, MetricKind::Ssimulacra2,
                      aggregate_percentile, scores);
  TIMER_END(metrics);
  if (status != EXIT_OK)
    return status;

  record.result =
      adjust_percentile(plan_.by_id, scores, settings_.q, settings_.encoder);
  record.avg_bitrate_kbps = report.average_bitrate_kbps;
  LOG_INFO("Average score {:.2f}", record.result.average_score);
  return EXIT_OK;
}

int Orchestrator::analyse_linear_fit(AdjustmentRecord &record) {
  const double target = settings_.target;

  // **----- PASS 1 -----**

  LOG_PHASE("Running the analysis pass 1 at CRF {}.",
            format_quantizer(LINEAR_PASS1_Q));
  PipelineFactory pass1 = make_factory(analysis_parameters(), "pass1_");
  std::vector<Chunk> chunks = with_quantizer(plan_.by_length, LINEAR_PASS1_Q);

  TIMER_START(analysis_pass1);
  CompletionReport report;
  int status = encode_pass(chunks, pass1, true, report);
  TIMER_END(analysis_pass1);
  if (status != EXIT_OK)
    return status;
  record.avg_bitrate_kbps = report.average_bitrate_kbps;

  TIMER_START(metrics_pass1);
  std::vector<ScoredChunk> scores1;
  status = score_pass(chunks, pass1, MetricKind::Butteraugli,
                      aggregate_cube_mean, scores1);
  TIMER_END(metrics_pass1);
  if (status != EXIT_OK)
    return status;

  // **----- PASS 2 -----**

  /// Each chunk moves toward the target side of its pass-1 score
  for (auto &c : chunks) {
    if (c.is_credits)
      continue;
    auto s = std::find_if(scores1.begin(), scores1.end(),
                          [&c](const ScoredChunk &sc) {
                            return sc.chunk_id == c.id;
                          });
    c.quantizer = linear_pass2_quantizer(s != scores1.end() ? s->score : 0.0,
                                         target);
  }

  LOG_PHASE("Running the analysis pass 2.");
  PipelineFactory pass2 = make_factory(analysis_parameters(), "pass2_");

  TIMER_START(analysis_pass2);
  CompletionReport report2;
  status = encode_pass(chunks, pass2, true, report2);
  TIMER_END(analysis_pass2);
  if (status != EXIT_OK)
    return status;

  TIMER_START(metrics_pass2);
  std::vector<ScoredChunk> scores2;
  status = score_pass(chunks, pass2, MetricKind::Butteraugli,
                      aggregate_cube_mean, scores2);
  TIMER_END(metrics_pass2);
  if (status != EXIT_OK)
    return status;

  record.result =
      adjust_linear_fit(plan_.by_id, scores1, scores2, target, settings_.q,
                        settings_.qadjust_cpu, final_preset_level());
  LOG_INFO("Pass 1 score {:.5f}", record.result.score_pass1);
  return EXIT_OK;
}

std::map<int, double> Orchestrator::measure_luma() {
  std::map<int, double> luma;
  VideoProbe probe(settings_.source);
  if (!probe.initialize()) {
    LOG_WARN("Cannot open source for luma measurement, damping disabled");
    return luma;
  }
  for (const auto &c : plan_.by_id) {
    if (c.is_credits)
      continue;
    if (token_.is_cancelled())
      break;
    double value = probe.measure_average_luma(c.start, c.end,
                                              settings_.qadjust_skip);
    if (value >= 0.0)
      luma[c.id] = value;
    else
      LOG_WARN("No luma measured for chunk {}", c.id);
  }
  return luma;
}

int Orchestrator::analyse_probe_curve(AdjustmentRecord &record) {
  const double target = settings_.target;

  // **----- PROBES -----**

  const int window = settings_.probe_window;

  ChunkPlan windows =
      plan_probe_chunks(info_.frame_count, settings_.probe_count, window,
                        settings_.probe_skip_fraction, settings_.credits_start);
  std::vector<double> probe_qs = probe_quantizers(
      settings_.min_q, settings_.max_q, settings_.probe_points);

  LOG_PHASE("Probing {} quantizers on {} windows of {} frames",
            probe_qs.size(), windows.by_id.size(), window);

  std::vector<QCurvePoint> curve;
  int status = EXIT_OK;
  TIMER_START(probe_curve);
  for (size_t i = 0; i < probe_qs.size(); ++i) {
    const double q = probe_qs[i];
    PipelineFactory factory =
        make_factory(analysis_parameters(), fmt::format("probe{}_", i));
    std::vector<Chunk> chunks = with_quantizer(windows.by_length, q);

    CompletionReport report;
    status = encode_pass(chunks, factory, true, report);
    if (status != EXIT_OK)
      break;

    std::vector<ScoredChunk> scores;
    status = score_pass(chunks, factory, MetricKind::Cvvdp, aggregate_mean,
                        scores);
    if (status != EXIT_OK)
      break;

    QCurvePoint point = make_curve_point(q, windows.by_id, scores);
    LOG_INFO("Probe q {} scored {:.4f}", format_quantizer(q), point.score);
    curve.push_back(point);
  }
  TIMER_END(probe_curve);
  if (status != EXIT_OK)
    return status;

  double analysis_q = 0.0;
  if (!interpolate_quantizer(curve, target, analysis_q)) {
    LOG_WARN("Probe curve has fewer than two usable points, every chunk "
             "keeps q {}",
             format_quantizer(settings_.q));
    record.result = keep_base_quantizer(plan_.by_id, QAdjustMode::ProbeCurve,
                                        settings_.q, target);
    record.result.curve = curve;
    return EXIT_OK;
  }
  analysis_q = std::clamp(round_to_quarter(analysis_q), settings_.min_q,
                          settings_.max_q);

  // **----- ANALYSIS PASS -----**

  LOG_PHASE("Running the analysis pass at q {}.", format_quantizer(analysis_q));
  PipelineFactory factory = make_factory(analysis_parameters(), "analysis_");
  std::vector<Chunk> chunks = with_quantizer(plan_.by_length, analysis_q);

  TIMER_START(analysis_pass);
  CompletionReport report;
  status = encode_pass(chunks, factory, true, report);
  TIMER_END(analysis_pass);
  if (status != EXIT_OK)
    return status;
  record.avg_bitrate_kbps = report.average_bitrate_kbps;

  TIMER_START(metrics);
  std::vector<ScoredChunk> scores;
  status = score_pass(chunks, factory, MetricKind::Cvvdp, aggregate_mean,
                      scores);
  TIMER_END(metrics);
  if (status != EXIT_OK)
    return status;

  TIMER_START(luma);
  std::map<int, double> luma = measure_luma();
  TIMER_END(luma);
  if (token_.is_cancelled())
    return EXIT_INTERRUPTED;

  ProbeCurveSettings curve_settings;
  curve_settings.target = target;
  curve_settings.base_q = settings_.q;
  curve_settings.min_q = settings_.min_q;
  curve_settings.max_q = settings_.max_q;
  curve_settings.luma_min = settings_.luma_min;
  curve_settings.luma_max = settings_.luma_max;
  curve_settings.pq = info_.is_pq;

  record.result = adjust_probe_curve(plan_.by_id, scores, curve, analysis_q,
                                     luma, curve_settings);
  return EXIT_OK;
}

int Orchestrator::reuse_record(AdjustmentRecord &record) {
  if (!fs::exists(record_path_)) {
    LOG_ERROR("No qadjust record to reuse at {}", record_path_);
    return EXIT_CONFIG_ERROR;
  }
  if (!load_adjustment_record(record_path_, record))
    return EXIT_CONFIG_ERROR;

  std::string reason;
  if (!validate_reuse(record, record_parameters(), plan_, reason)) {
    LOG_ERROR("The stored qadjust analysis cannot be reused: {}", reason);
    return EXIT_CONFIG_ERROR;
  }

  const double stored_target = record.parameters.target;
  if (!settings_.has_target || settings_.target == stored_target) {
    LOG_INFO("Reusing the stored quantizers (target {})", stored_target);
  } else {
    LOG_INFO("Recalculating the quantizers based on existing analysis data "
             "and target {}",
             settings_.target);
    switch (record.result.mode) {
    case QAdjustMode::LinearFit:
      record.result =
          recompute_linear_fit(record.result, settings_.target,
                               record.parameters.analysis_preset,
                               final_preset_level());
      break;
    case QAdjustMode::ProbeCurve:
      record.result = recompute_probe_curve(record.result, settings_.target,
                                            settings_.min_q, settings_.max_q);
      break;
    case QAdjustMode::Percentile:
      LOG_WARN("Percentile mode has no target, stored quantizers are used");
      break;
    }
    record.parameters.target = settings_.target;
  }
  return EXIT_OK;
}

void Orchestrator::remove_encoded_chunks() {
  std::error_code ec;
  for (fs::directory_iterator it(chunks_dir_, ec), end; !ec && it != end;
       it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.rfind("encoded_chunk_", 0) != 0)
      continue;
    std::error_code rm_ec;
    fs::remove(it->path(), rm_ec);
    if (rm_ec)
      LOG_WARN("Unable to remove {}: {}", name, rm_ec.message());
  }
  if (ec)
    LOG_WARN("Unable to remove the intermediate files: {}", ec.message());
}

int Orchestrator::run_qadjust() {
  AdjustmentRecord record;
  int status = EXIT_OK;

  if (settings_.qadjust_reuse) {
    status = reuse_record(record);
  } else {
    record.parameters = record_parameters();
    LOG_PHASE("================== QUALITY ANALYSIS ==================");
    LOG_INFO("Mode {} ({}), analysis preset {}",
             static_cast<int>(settings_.qadjust_mode),
             qadjust_mode_name(settings_.qadjust_mode), settings_.qadjust_cpu);

    switch (settings_.qadjust_mode) {
    case QAdjustMode::Percentile:
      status = analyse_percentile(record);
      break;
    case QAdjustMode::LinearFit:
      status = analyse_linear_fit(record);
      break;
    case QAdjustMode::ProbeCurve:
      status = analyse_probe_curve(record);
      break;
    }
    /// Percentile mode derives its own target
    record.parameters.target = record.result.target;
  }
  if (status != EXIT_OK)
    return status;

  const int changed = apply_adjustments(record.result, plan_);
  LOG_INFO("Adjusted the quantizer of {} of {} chunks", changed,
           plan_.by_id.size());
  log_distribution(plan_.by_id);
  record.result.weighted_q = weighted_mean_quantizer(plan_.by_id);

  if (!save_adjustment_record(record_path_, record))
    return EXIT_CONFIG_ERROR;
  LOG_INFO("Qadjust record written to {}", record_path_);

  remove_encoded_chunks();
  return EXIT_OK;
}

// **---- Final Pass ----**

int Orchestrator::final_pass() {
  PipelineFactory factory = make_factory(final_parameters(), "");
  LOG_PHASE("================== FINAL ENCODE ==================");
  LOG_INFO("The encoder parameters for the final encode: {}",
           join_argv(build_encode_argv(factory.parameters(), "-", 0)));

  TIMER_START(final_pass);
  CompletionReport report;
  int status = encode_pass(plan_.by_length, factory, false, report);
  TIMER_END(final_pass);

  if (status == EXIT_INTERRUPTED) {
    LOG_WARN("Interrupted, finished chunks are kept in {}", chunks_dir_);
    return status;
  }
  if (status != EXIT_OK) {
    LOG_ERROR("{} chunks failed, not concatenating", report.failed.size());
    return status;
  }

  LOG_INFO("Estimated final size {:.2f} MB", report.estimated_size_mb);

  std::vector<std::string> paths;
  paths.reserve(plan_.by_id.size());
  for (const auto &c : plan_.by_id)
    paths.push_back(factory.output_path(c.id));

  TIMER_START(concat);
  int rc = concat_chunks(paths, output_file_, settings_.encoder, info_.fps);
  TIMER_END(concat);
  if (rc != 0)
    return EXIT_CONFIG_ERROR;

  LOG_SUCCESS("Output: {} ({:.2f} MB)", output_file_,
              file_size_or_zero(output_file_) / 1024.0 / 1024.0);
  return EXIT_OK;
}

// **---- Main Processing ----**

int Orchestrator::execute() {
  int status = prepare();
  if (status != EXIT_OK)
    return status;

  if (settings_.list_parameters)
    return list_parameters();

  status = plan();
  if (status != EXIT_OK)
    return status;

  status = setup_folders();
  if (status != EXIT_OK)
    return status;

  if (settings_.qadjust) {
    status = run_qadjust();
    if (status != EXIT_OK)
      return status;
    if (settings_.qadjust_only) {
      LOG_SUCCESS("Quality analysis finished");
      return EXIT_OK;
    }
  }

  return final_pass();
}

int Orchestrator::run() {
  auto run_start = std::chrono::steady_clock::now();
  install_interrupt_handler(token_);

  TIMER_START(total_run);
  int status = execute();
  TIMER_END(total_run);

  remove_interrupt_handler();

  if (status == EXIT_INTERRUPTED || token_.is_cancelled()) {
    LOG_WARN("Process interrupted.");
    status = EXIT_INTERRUPTED;
  } else {
    double elapsed = std::chrono::duration<double>(
                         std::chrono::steady_clock::now() - run_start)
                         .count();
    LOG_INFO("Process finished, total duration {}.", format_time(elapsed));
  }

  TimingCollector::print_summary();
  close_log_file();
  return status;
}

} // namespace chunk_encode
