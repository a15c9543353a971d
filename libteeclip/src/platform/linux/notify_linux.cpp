/**
 * @file notify_linux.cpp
 * @brief notify-send invocation
 */

#include "subprocess.h"
#include "teeclip/helper.h"
#include "teeclip/log.h"
#include "teeclip/notify.h"

namespace teeclip {

Result<void> send_notification(const std::string &summary,
                               const std::string &body) {
  auto env = DiscoveryEnvironment::from_process();
  auto path = find_executable(NOTIFY_PROGRAM, env.search_path);
  if (!path) {
    return Error(ErrorCode::NotSupported,
                 std::string(NOTIFY_PROGRAM) + " not found");
  }

  platform::SpawnOptions options;
  options.pipe_stdin = false;
  options.capture_stderr = false;

  auto proc = platform::Subprocess::spawn(*path, {summary, body}, options);
  if (proc.is_error()) {
    return proc.error();
  }

  auto status = proc.value().wait();
  if (status.is_error()) {
    return status.error();
  }
  if (!status.value().success()) {
    return Error(ErrorCode::HelperExitError,
                 std::string(NOTIFY_PROGRAM) + " failed: " +
                     status.value().describe());
  }

  logging::diag()->debug("notification sent");
  return Result<void>::ok();
}

} // namespace teeclip
