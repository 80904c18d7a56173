/**
 * @file cli.cpp
 * @brief Command-line parsing implementation
 */

#include "chunk_encode/cli.hpp"

#include <getopt.h>
#include <stdexcept>

#include <fmt/core.h>

namespace chunk_encode {

namespace {

enum OptionId {
  OPT_SCENES = 256,
  OPT_ENCODER,
  OPT_PRESET,
  OPT_THREADS,
  OPT_Q,
  OPT_MIN_CHUNK_LENGTH,
  OPT_MAX_PARALLEL,
  OPT_CREDITS_START,
  OPT_CREDITS_Q,
  OPT_CREDITS_CPU,
  OPT_EXTRA_PARAMS,
  OPT_QADJUST,
  OPT_QADJUST_MODE,
  OPT_QADJUST_REUSE,
  OPT_QADJUST_ONLY,
  OPT_QADJUST_SKIP,
  OPT_QADJUST_CPU,
  OPT_QADJUST_WORKERS,
  OPT_QADJUST_TARGET,
  OPT_MIN_Q,
  OPT_MAX_Q,
  OPT_PROBE_COUNT,
  OPT_METRIC_COMMAND,
  OPT_OUTPUT_DIR,
  OPT_LIST_PARAMETERS,
  OPT_HELP
};

const struct option long_options[] = {
    {"scenes", required_argument, nullptr, OPT_SCENES},
    {"encoder", required_argument, nullptr, OPT_ENCODER},
    {"preset", required_argument, nullptr, OPT_PRESET},
    {"threads", required_argument, nullptr, OPT_THREADS},
    {"q", required_argument, nullptr, OPT_Q},
    {"min-chunk-length", required_argument, nullptr, OPT_MIN_CHUNK_LENGTH},
    {"max-parallel-encodes", required_argument, nullptr, OPT_MAX_PARALLEL},
    {"credits-start-frame", required_argument, nullptr, OPT_CREDITS_START},
    {"credits-q", required_argument, nullptr, OPT_CREDITS_Q},
    {"credits-cpu", required_argument, nullptr, OPT_CREDITS_CPU},
    {"extra-params", required_argument, nullptr, OPT_EXTRA_PARAMS},
    {"qadjust", no_argument, nullptr, OPT_QADJUST},
    {"qadjust-mode", required_argument, nullptr, OPT_QADJUST_MODE},
    {"qadjust-reuse", no_argument, nullptr, OPT_QADJUST_REUSE},
    {"qadjust-only", no_argument, nullptr, OPT_QADJUST_ONLY},
    {"qadjust-skip", required_argument, nullptr, OPT_QADJUST_SKIP},
    {"qadjust-cpu", required_argument, nullptr, OPT_QADJUST_CPU},
    {"qadjust-workers", required_argument, nullptr, OPT_QADJUST_WORKERS},
    {"qadjust-target", required_argument, nullptr, OPT_QADJUST_TARGET},
    {"min-q", required_argument, nullptr, OPT_MIN_Q},
    {"max-q", required_argument, nullptr, OPT_MAX_Q},
    {"probe-count", required_argument, nullptr, OPT_PROBE_COUNT},
    {"metric-command", required_argument, nullptr, OPT_METRIC_COMMAND},
    {"output-dir", required_argument, nullptr, OPT_OUTPUT_DIR},
    {"list-parameters", no_argument, nullptr, OPT_LIST_PARAMETERS},
    {"help", no_argument, nullptr, OPT_HELP},
    {nullptr, 0, nullptr, 0}};

bool parse_int(const char *text, int &value) {
  try {
    size_t used = 0;
    std::string s(text);
    value = std::stoi(s, &used);
    return used == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

bool parse_double(const char *text, double &value) {
  try {
    size_t used = 0;
    std::string s(text);
    value = std::stod(s, &used);
    return used == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

} // anonymous namespace

std::string usage_text(const char *program) {
  return fmt::format(
      "Usage: {} <source> --scenes <file> [options]\n"
      "\n"
      "Encoding:\n"
      "  --encoder svt|x265|aom|rav1e  Encoder (default svt)\n"
      "  --preset N                    Encoder speed level (x265: preset name)\n"
      "  --threads N                   Threads per encoder\n"
      "  --q Q                         Quantizer / CRF\n"
      "  --min-chunk-length N          Minimum chunk length in frames\n"
      "  --max-parallel-encodes N      Concurrent chunk encodes\n"
      "  --credits-start-frame N       First frame of the credits\n"
      "  --credits-q Q                 Quantizer for the credits\n"
      "  --credits-cpu N               Speed level for the credits\n"
      "  --extra-params \"ARGS\"         Extra encoder arguments\n"
      "  --output-dir DIR              Base working folder\n"
      "  --list-parameters             Print the encoder commands and exit\n"
      "\n"
      "Quality adjustment:\n"
      "  --qadjust                     Enable per-chunk quality adjustment\n"
      "  --qadjust-mode 1|2|3          1 percentile, 2 linear fit, 3 probe "
      "curve\n"
      "  --qadjust-reuse               Reuse the stored analysis\n"
      "  --qadjust-only                Run the analysis only\n"
      "  --qadjust-skip N              Metric frame stride\n"
      "  --qadjust-cpu N               Speed level of the analysis passes\n"
      "  --qadjust-workers W,T         Metric workers and threads each\n"
      "  --qadjust-target S            Target score\n"
      "  --min-q Q / --max-q Q         Quantizer bounds\n"
      "  --probe-count N               Probe windows (mode 3)\n"
      "  --metric-command \"TEMPLATE\"   Metric command template\n",
      program);
}

CliStatus parse_command_line(int argc, char *argv[], RunSettings &settings,
                             std::string &error) {
  /// Full getopt reset so repeated parses start fresh
  optind = 0;
  opterr = 0;

  int n;
  int mode = 0;
  int option_index = -1;
  while ((n = getopt_long(argc, argv, "h", long_options, &option_index)) !=
         -1) {
    bool ok = true;
    switch (n) {
    case OPT_SCENES:
      settings.scenes_path = optarg;
      break;
    case OPT_ENCODER:
      if (!parse_encoder_family(optarg, settings.encoder)) {
        error = "Valid encoder choices are rav1e, svt, aom or x265.";
        return CliStatus::Error;
      }
      break;
    case OPT_PRESET:
      settings.preset = optarg;
      break;
    case OPT_THREADS:
      ok = parse_int(optarg, settings.threads);
      break;
    case OPT_Q:
      ok = parse_double(optarg, settings.q);
      break;
    case OPT_MIN_CHUNK_LENGTH:
      ok = parse_int(optarg, settings.min_chunk_length);
      break;
    case OPT_MAX_PARALLEL:
      ok = parse_int(optarg, settings.max_parallel);
      break;
    case OPT_CREDITS_START:
      ok = parse_int(optarg, settings.credits_start) &&
           settings.credits_start >= 0;
      break;
    case OPT_CREDITS_Q:
      ok = parse_double(optarg, settings.credits_q);
      break;
    case OPT_CREDITS_CPU:
      ok = parse_int(optarg, settings.credits_cpu);
      break;
    case OPT_EXTRA_PARAMS:
      settings.extra_params = optarg;
      break;
    case OPT_QADJUST:
      settings.qadjust = true;
      break;
    case OPT_QADJUST_MODE:
      ok = parse_int(optarg, mode) && !(mode < 1 || mode > 3);
      if (ok)
        settings.qadjust_mode = static_cast<QAdjustMode>(mode);
      break;
    case OPT_QADJUST_REUSE:
      settings.qadjust_reuse = true;
      break;
    case OPT_QADJUST_ONLY:
      settings.qadjust_only = true;
      break;
    case OPT_QADJUST_SKIP:
      ok = parse_int(optarg, settings.qadjust_skip);
      break;
    case OPT_QADJUST_CPU:
      ok = parse_int(optarg, settings.qadjust_cpu);
      break;
    case OPT_QADJUST_WORKERS:
      if (!parse_worker_spec(optarg, settings.metric_workers,
                             settings.metric_threads)) {
        error = "Invalid format for --qadjust-workers. Expected format: "
                "workers,threads (e.g., 2,4).";
        return CliStatus::Error;
      }
      break;
    case OPT_QADJUST_TARGET:
      ok = parse_double(optarg, settings.target) && settings.target > 0.0;
      settings.has_target = ok;
      break;
    case OPT_MIN_Q:
      ok = parse_double(optarg, settings.min_q) && settings.min_q >= 0.0;
      break;
    case OPT_MAX_Q:
      ok = parse_double(optarg, settings.max_q) && settings.max_q >= 0.0;
      break;
    case OPT_PROBE_COUNT:
      ok = parse_int(optarg, settings.probe_count);
      break;
    case OPT_METRIC_COMMAND:
      settings.metric_command = optarg;
      break;
    case OPT_OUTPUT_DIR:
      settings.work_dir = optarg;
      break;
    case OPT_LIST_PARAMETERS:
      settings.list_parameters = true;
      break;
    case 'h':
    case OPT_HELP:
      return CliStatus::Help;
    case '?':
    default:
      if (optopt >= OPT_SCENES)
        error = fmt::format("Option '{}' needs a value", argv[optind - 1]);
      else
        error = fmt::format("Unknown option '{}'", argv[optind - 1]);
      return CliStatus::Error;
    }

    if (!ok) {
      error = fmt::format("Invalid value '{}' for --{}", optarg,
                          long_options[option_index].name);
      return CliStatus::Error;
    }
  }

  if (argc - optind != 1) {
    error = argc - optind < 1 ? "You need to supply a source video to encode."
                              : "Only one source video can be given.";
    return CliStatus::Error;
  }
  settings.source = argv[optind];

  if (!validate_settings(settings, error))
    return CliStatus::Error;
  return CliStatus::Run;
}

} // namespace chunk_encode
