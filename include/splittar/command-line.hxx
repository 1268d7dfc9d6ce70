/**
 * @file command-line.hxx
 * @brief argv parsing for the splittar executable.
 */

#pragma once

#include <splittar/logging.hxx>
#include <splittar/run.hxx>

#include <string>
#include <string_view>

namespace splittar {

/**
 * @struct CommandLine
 * @brief Everything the executable needs after parsing argv.
 */
struct CommandLine {
  RunConfig config;
  severity_level log_level = boost::log::trivial::warning;
  bool show_help = false;
};

/**
 * @brief Parse `splittar [options] [SOURCE|-] [TARGET|-]`.
 *
 * Uses getopt_long(3) and resets its global state, so it may be called more
 * than once per process.
 *
 * @throws ConfigError (including SizeParseError) for unknown options,
 * missing or malformed option arguments and extra positional arguments.
 */
CommandLine parse_command_line(int argc, char *argv[]);

/**
 * @brief Help text shown for -h.
 */
std::string usage(std::string_view program);

} // namespace splittar
