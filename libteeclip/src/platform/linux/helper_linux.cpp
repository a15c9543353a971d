/**
 * @file helper_linux.cpp
 * @brief wl-copy / xclip / xsel discovery and invocation
 */

#include "subprocess.h"
#include "teeclip/helper.h"
#include "teeclip/log.h"
#include "teeclip/sanitizer.h"
#include <cstdlib>
#include <sys/stat.h>
#include <unistd.h>

namespace teeclip {

namespace {

std::string env_or_empty(const char *name) {
  const char *value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

bool is_executable_file(const std::string &path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    return false;
  }
  return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

std::string join_args(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &arg : args) {
    out += ' ';
    out += arg;
  }
  return out;
}

std::optional<HelperDescriptor> make_wayland_helper(const std::string &path) {
  HelperDescriptor helper;
  helper.path = path;
  helper.one_shot_required = true;
  return helper;
}

} // namespace

// ============================================================================
// DiscoveryEnvironment
// ============================================================================

DiscoveryEnvironment DiscoveryEnvironment::from_process() {
  DiscoveryEnvironment env;
  env.wayland_display = env_or_empty("WAYLAND_DISPLAY");
  env.x_display = env_or_empty("DISPLAY");
  env.search_path = env_or_empty("PATH");
  return env;
}

// ============================================================================
// HelperDescriptor
// ============================================================================

std::string HelperDescriptor::name() const {
  auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::vector<std::string> HelperDescriptor::invocation_args() const {
  std::vector<std::string> result;
  result.reserve(args.size() + 1);
  if (one_shot_required) {
    result.emplace_back(ONE_SHOT_FLAG);
  }
  result.insert(result.end(), args.begin(), args.end());
  return result;
}

// ============================================================================
// Discovery
// ============================================================================

std::optional<std::string> find_executable(const std::string &name,
                                           const std::string &search_path) {
  if (name.empty()) {
    return std::nullopt;
  }

  if (name.find('/') != std::string::npos) {
    if (is_executable_file(name)) {
      return name;
    }
    return std::nullopt;
  }

  size_t start = 0;
  for (;;) {
    size_t end = search_path.find(':', start);
    std::string dir = search_path.substr(
        start, end == std::string::npos ? std::string::npos : end - start);

    // Empty and relative entries would resolve against the working directory
    if (!dir.empty() && dir[0] == '/') {
      std::string candidate = dir + "/" + name;
      if (is_executable_file(candidate)) {
        return candidate;
      }
    }

    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }

  return std::nullopt;
}

std::optional<HelperDescriptor>
discover_helper(const DiscoveryEnvironment &env) {
  auto log = logging::diag();

  // Prefer wl-copy on Wayland
  if (env.is_wayland()) {
    if (auto path = find_executable(WAYLAND_HELPER, env.search_path)) {
      log->debug("wayland session: using {}", *path);
      return make_wayland_helper(*path);
    }
    log->debug("wayland session but {} not found", WAYLAND_HELPER);
  }

  // X11 helpers
  if (env.is_x11()) {
    if (auto path = find_executable(X11_PRIMARY_HELPER, env.search_path)) {
      log->debug("x11 session: using {}", *path);
      HelperDescriptor helper;
      helper.path = *path;
      helper.args = {"-selection", "clipboard"};
      return helper;
    }
    if (auto path = find_executable(X11_SECONDARY_HELPER, env.search_path)) {
      log->debug("x11 session: using {}", *path);
      HelperDescriptor helper;
      helper.path = *path;
      helper.args = {"--clipboard", "--input"};
      return helper;
    }
    log->debug("x11 session but neither {} nor {} found", X11_PRIMARY_HELPER,
               X11_SECONDARY_HELPER);
  }

  // Headless or SSH sessions may still reach a compositor through wl-copy
  if (auto path = find_executable(WAYLAND_HELPER, env.search_path)) {
    log->debug("no session detected: trying {} anyway", *path);
    return make_wayland_helper(*path);
  }

  return std::nullopt;
}

// ============================================================================
// Invocation
// ============================================================================

Result<void> invoke_helper(const HelperDescriptor &helper,
                           const Content &content) {
  auto log = logging::diag();
  auto args = helper.invocation_args();
  log->debug("running {}{}", helper.path, join_args(args));

  auto spawned = platform::Subprocess::spawn(helper.path, args);
  if (spawned.is_error()) {
    return spawned.error();
  }
  auto &proc = spawned.value();

  auto written = proc.write_input(content);
  if (written.is_error()) {
    proc.kill();
    return written.error().with_prefix(helper.name());
  }

  auto status = proc.wait();
  if (status.is_error()) {
    return status.error().with_prefix(helper.name());
  }

  if (!status.value().success()) {
    std::string stderr_text = trim_whitespace(proc.stderr_output());
    log->debug("{} failed: {} ({})", helper.name(),
               status.value().describe(), stderr_text);
    return Error(ErrorCode::HelperExitError,
                 helper.name() + " failed: " + status.value().describe(),
                 stderr_text);
  }

  log->debug("{} accepted {} bytes", helper.name(), content.size());
  return Result<void>::ok();
}

} // namespace teeclip
