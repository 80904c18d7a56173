/**
 * @file cli.hpp
 * @brief Command-line parsing into RunSettings
 */

#ifndef CHUNK_ENCODE_CLI_HPP
#define CHUNK_ENCODE_CLI_HPP

#include <string>

#include "run_settings.hpp"

namespace chunk_encode {

enum class CliStatus {
  Run,  //< Settings parsed, continue
  Help, //< Usage printed, exit 0
  Error //< Bad arguments, exit 1
};

/**
 * @brief Parse argv with getopt_long.
 *
 * @param argc Argument count
 * @param argv Argument vector (getopt may permute it)
 * @param settings Output: parsed settings, defaults not yet resolved
 * @param error Output: message for CliStatus::Error
 */
CliStatus parse_command_line(int argc, char *argv[], RunSettings &settings,
                             std::string &error);

/// Usage text
std::string usage_text(const char *program);

} // namespace chunk_encode

#endif // CHUNK_ENCODE_CLI_HPP
