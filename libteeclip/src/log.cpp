/**
 * @file log.cpp
 * @brief spdlog logger registry
 */

#include "teeclip/log.h"
#include <cstdlib>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace teeclip {
namespace logging {

namespace {

constexpr const char *DIAG_LOGGER = "teeclip";
constexpr const char *CONSOLE_LOGGER = "console";

// Patterns are per sink, so each logger family gets its own stderr sink.
struct Sinks {
  std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> diag_sink;
  std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink;

  Sinks() {
    diag_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    diag_sink->set_pattern("[teeclip] [%^%l%$] %v");

    console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("%v");
  }
};

Sinks &sinks() {
  static Sinks instance;
  return instance;
}

std::mutex &registry_mutex() {
  static std::mutex m;
  return m;
}

std::optional<spdlog::level::level_enum> level_from_env() {
  const char *value = std::getenv(LOG_LEVEL_ENV);
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return parse_level(value);
}

} // namespace

std::optional<spdlog::level::level_enum> parse_level(const std::string &name) {
  auto level = spdlog::level::from_str(name);
  // from_str falls back to "off" for anything it does not know
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

Logger get(const std::string &name) {
  std::lock_guard<std::mutex> lock(registry_mutex());

  if (auto existing = spdlog::get(name)) {
    return existing;
  }

  auto &s = sinks();
  Logger logger;
  if (name == CONSOLE_LOGGER) {
    logger = std::make_shared<spdlog::logger>(name, s.console_sink);
    logger->set_level(spdlog::level::info);
  } else {
    logger = std::make_shared<spdlog::logger>(name, s.diag_sink);
    logger->set_level(level_from_env().value_or(spdlog::level::warn));
  }
  logger->flush_on(spdlog::level::trace);
  spdlog::register_logger(logger);
  return logger;
}

Logger diag() { return get(DIAG_LOGGER); }

Logger console() { return get(CONSOLE_LOGGER); }

void init(bool verbose, bool quiet) {
  auto level = level_from_env().value_or(spdlog::level::warn);
  if (verbose && level > spdlog::level::debug) {
    level = spdlog::level::debug;
  }
  diag()->set_level(level);

  console()->set_level(quiet ? spdlog::level::err : spdlog::level::info);
}

} // namespace logging
} // namespace teeclip
