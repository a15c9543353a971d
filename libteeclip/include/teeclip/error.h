/**
 * @file error.h
 * @brief Error codes and result types for teeclip
 *
 * teeclip uses a Result type pattern for error handling. Library code never
 * throws across its API; the CLI turns errors into diagnostics and exit
 * codes.
 */

#ifndef TEECLIP_ERROR_H
#define TEECLIP_ERROR_H

#include "platform.h"
#include <optional>
#include <string>
#include <variant>

namespace teeclip {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : int {
  // Success (0)
  Success = 0,

  // General errors (1-99)
  Unknown = 1,
  InvalidArgument = 2,
  NotSupported = 3,

  // Input errors (100-199)
  InputError = 100,
  NoPipedInput = 101,

  // File sink errors (200-299)
  FileWriteError = 200,

  // Helper errors (300-399)
  HelperUnavailable = 300,
  HelperSpawnError = 301,
  HelperWriteError = 302,
  HelperExitError = 303,

  // Fallback transport errors (400-499)
  TerminalUnavailableError = 400,
  FallbackWriteError = 401,
  ClipboardUnavailable = 402,
  EncodingError = 403
};

// ============================================================================
// Error Information
// ============================================================================

/**
 * @brief What went wrong, for which step
 *
 * `message` names the failing operation ("write stdin", "open /dev/tty");
 * `details` carries the system reason or the helper's stderr.
 */
struct Error {
  ErrorCode code = ErrorCode::Success;
  std::string message;
  std::string details;

  Error() = default;

  explicit Error(ErrorCode c, std::string msg = "", std::string det = "")
      : code(c), message(std::move(msg)), details(std::move(det)) {}

  /// "message (details)", or the code description when message is empty
  std::string to_string() const;

  /// Copy of this error with "prefix: " in front of the message
  Error with_prefix(const std::string &prefix) const {
    return Error(code, prefix + ": " + message, details);
  }
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Either a value or the Error that prevented it
 *
 * Usage:
 *   auto captured = capture_input(options);
 *   if (!captured) {
 *       return captured.error();
 *   }
 *   const Content &content = captured.value().content;
 */
template <typename T> class Result {
public:
  /// Construct with success value
  Result(T value) : data_(std::move(value)) {}

  /// Construct with error
  Result(Error error) : data_(std::move(error)) {}

  /// Check if result is success
  bool is_ok() const { return std::holds_alternative<T>(data_); }

  /// Check if result is error
  bool is_error() const { return std::holds_alternative<Error>(data_); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the value (undefined behavior if error)
  T &value() & { return std::get<T>(data_); }
  const T &value() const & { return std::get<T>(data_); }
  T &&value() && { return std::get<T>(std::move(data_)); }

  /// Get the error (undefined behavior if success)
  Error &error() & { return std::get<Error>(data_); }
  const Error &error() const & { return std::get<Error>(data_); }

  /// Get value or default
  T value_or(T default_value) const {
    return is_ok() ? std::get<T>(data_) : std::move(default_value);
  }

private:
  std::variant<T, Error> data_;
};

/**
 * @brief Success or an Error, for steps that produce nothing
 */
template <> class Result<void> {
public:
  /// Construct success
  Result() : error_(std::nullopt) {}

  /// Construct with error
  Result(Error error) : error_(std::move(error)) {}

  bool is_ok() const { return !error_.has_value(); }
  bool is_error() const { return error_.has_value(); }
  explicit operator bool() const { return is_ok(); }

  Error &error() { return error_.value(); }
  const Error &error() const { return error_.value(); }

  /// Create success result
  static Result ok() { return Result(); }

private:
  std::optional<Error> error_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

/// Propagate the error of a Result-returning step
#define TEECLIP_TRY(expr)                                                      \
  do {                                                                         \
    auto &&teeclip_try_result_ = (expr);                                       \
    if (teeclip_try_result_.is_error()) {                                      \
      return teeclip_try_result_.error();                                      \
    }                                                                          \
  } while (0)

/// Fail with @p error_code unless @p condition holds
#define TEECLIP_REQUIRE(condition, error_code, message)                        \
  do {                                                                         \
    if (!(condition)) {                                                        \
      return ::teeclip::Error(error_code, message);                            \
    }                                                                          \
  } while (0)

// ============================================================================
// Error Code Helpers
// ============================================================================

/// Enumerator name, e.g. "HelperExitError"
TEECLIP_API const char *error_code_name(ErrorCode code);

/// One-line description used when an Error carries no message
TEECLIP_API const char *error_code_description(ErrorCode code);

/**
 * @brief Check if error code is recoverable
 *
 * Recoverable codes are handled inside the library (helper failures trigger
 * the OSC 52 fallback); everything else ends the run with exit code 1.
 */
TEECLIP_API bool is_recoverable(ErrorCode code);

} // namespace teeclip

#endif // TEECLIP_ERROR_H
