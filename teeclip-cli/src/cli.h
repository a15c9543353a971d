/**
 * @file cli.h
 * @brief Command-line parsing and usage text for the teeclip executable
 */

#ifndef TEECLIP_CLI_CLI_H
#define TEECLIP_CLI_CLI_H

#include <string>
#include <teeclip/teeclip.h>

namespace teeclip {
namespace cli {

/// Exit code for command-line misuse
constexpr int EXIT_USAGE = 2;

/**
 * @brief What main() should do after parsing
 */
enum class ParseAction { Run, ShowHelp, ShowVersion, UsageError };

struct ParseResult {
  ParseAction action = ParseAction::Run;

  /// Explanation when action == UsageError (may be empty: getopt already
  /// printed one)
  std::string message;
};

/**
 * @brief Apply argv flags on top of @p config
 *
 * Resets getopt state, so it may be called more than once per process.
 */
ParseResult parse_args(int argc, char *argv[], TeeclipConfig &config);

/// Usage text with examples and the option list
std::string usage_text(const std::string &prog);

/// Line(s) printed to stderr for a fatal pipeline error
std::string describe_failure(const Error &error, const std::string &prog);

} // namespace cli
} // namespace teeclip

#endif // TEECLIP_CLI_CLI_H
