/**
 * @file log.h
 * @brief spdlog setup for teeclip
 *
 * Two loggers, each with its own stderr sink:
 * - "teeclip": diagnostics, warn by default, raised by TEECLIP_LOG_LEVEL
 *   or --verbose
 * - "console": the short status lines a user sees ("Copied to clipboard.")
 */

#ifndef TEECLIP_LOG_H
#define TEECLIP_LOG_H

#include "platform.h"
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

namespace teeclip {
namespace logging {

using Logger = std::shared_ptr<spdlog::logger>;

/// Environment variable holding the diagnostic log level
constexpr const char *LOG_LEVEL_ENV = "TEECLIP_LOG_LEVEL";

/// Get (or lazily create) a named logger attached to the shared sink
TEECLIP_API Logger get(const std::string &name);

/// Diagnostic logger
TEECLIP_API Logger diag();

/// User-facing status logger
TEECLIP_API Logger console();

/**
 * @brief Configure levels for both loggers
 * @param verbose Force debug diagnostics
 * @param quiet Suppress console status lines below error
 */
TEECLIP_API void init(bool verbose, bool quiet);

/// Parse a level name ("debug", "warn", ...); nullopt if unrecognised
TEECLIP_API std::optional<spdlog::level::level_enum>
parse_level(const std::string &name);

} // namespace logging
} // namespace teeclip

#endif // TEECLIP_LOG_H
