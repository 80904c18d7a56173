/**
 * @file main.cpp
 * @brief Entry point for Chunk Encode
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Handing the settings to the Orchestrator
 *
 * @note Tuning knobs without a flag (pool sizes, probe layout, tool paths)
 *       come from environment variables, see config.hpp.
 */

#include <cstdio>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "chunk_encode/cli.hpp"
#include "chunk_encode/logging.hpp"
#include "chunk_encode/orchestrator.hpp"

using namespace chunk_encode;

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  RunSettings settings;
  std::string error;

  switch (parse_command_line(argc, argv, settings, error)) {
  case CliStatus::Help:
    fmt::print("{}", usage_text(argv[0]));
    return EXIT_OK;
  case CliStatus::Error:
    LOG_ERROR("{}", error);
    fmt::print("{}", usage_text(argv[0]));
    return EXIT_CONFIG_ERROR;
  case CliStatus::Run:
    break;
  }

  LOG_INFO("Chunk Encode");
  LOG_INFO("Source: {}", settings.source);
  LOG_INFO("Encoder: {}", encoder_family_name(settings.encoder));
  if (settings.qadjust) {
    LOG_INFO("Quality adjustment: mode {} ({}){}",
             static_cast<int>(settings.qadjust_mode),
             qadjust_mode_name(settings.qadjust_mode),
             settings.qadjust_reuse ? ", reusing stored analysis" : "");
  }

  Orchestrator orchestrator(std::move(settings));
  return orchestrator.run();
}
