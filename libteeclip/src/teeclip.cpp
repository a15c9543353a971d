/**
 * @file teeclip.cpp
 * @brief Pipeline orchestration
 */

#include "teeclip/teeclip.h"

namespace teeclip {

namespace {

constexpr const char *NOTIFY_SUMMARY = "teeclip";
constexpr const char *NOTIFY_BODY = "Content copied to clipboard";

} // namespace

Pipeline::Pipeline(TeeclipConfig config, PipelineIo io)
    : config_(std::move(config)), io_(std::move(io)) {}

Result<PipelineReport> Pipeline::run() const {
  auto log = logging::diag();
  auto console = logging::console();

  TEECLIP_TRY(config_.validate());
  TEECLIP_TRY(check_piped_input(io_.input_fd));

  // ========================================================================
  // Capture
  // ========================================================================

  CaptureOptions capture_options;
  capture_options.input_fd = io_.input_fd;
  capture_options.mirror = !config_.quiet;
  capture_options.mirror_fd = io_.output_fd;
  capture_options.limit = config_.max_input_size;

  auto captured = capture_input(capture_options);
  if (captured.is_error()) {
    return captured.error();
  }

  PipelineReport report;
  report.bytes_read = captured.value().content.size();
  report.input_truncated = captured.value().truncated;

  // ========================================================================
  // Clean
  // ========================================================================

  const Content content =
      sanitize(captured.value().content, config_.sanitize_options());
  report.content_size = content.size();
  log->debug("captured {} bytes, {} after cleaning", report.bytes_read,
             report.content_size);

  if (content.empty()) {
    console->info("No content to copy.");
    report.nothing_to_copy = true;
    return report;
  }

  // ========================================================================
  // File
  // ========================================================================

  if (!config_.output_file.empty()) {
    auto mode = config_.append ? WriteMode::Append : WriteMode::Truncate;
    auto saved = write_to_file(config_.output_file, content, mode);
    if (saved.is_error()) {
      return saved.error();
    }
    report.bytes_saved = saved.value();
    console->info("Saved {} bytes to {}", report.bytes_saved,
                  config_.output_file.string());
  }

  // ========================================================================
  // Clipboard
  // ========================================================================

  if (!config_.copy_to_clipboard) {
    return report;
  }

  DeliveryConfig delivery_config;
  delivery_config.allow_helpers = !config_.force_osc52;
  delivery_config.tty_path = config_.tty_path;
  delivery_config.environment = io_.discovery;

  auto outcome = ClipboardDelivery(delivery_config).deliver(content);
  TEECLIP_TRY(delivery_result(outcome));

  report.copied = true;
  report.transport = outcome.transport;
  log->debug("copied via {}", transport_name(outcome.transport));
  console->info("Copied to clipboard.");

  // ========================================================================
  // Notify
  // ========================================================================

  if (config_.notify) {
    auto notified = send_notification(NOTIFY_SUMMARY, NOTIFY_BODY);
    if (notified.is_error()) {
      log->debug("notification skipped: {}", notified.error().to_string());
    }
  }

  return report;
}

Result<PipelineReport> run_pipeline(const TeeclipConfig &config,
                                    const PipelineIo &io) {
  return Pipeline(config, io).run();
}

} // namespace teeclip
