/**
 * @file notify.h
 * @brief Best-effort desktop notification via notify-send
 */

#ifndef TEECLIP_NOTIFY_H
#define TEECLIP_NOTIFY_H

#include "error.h"
#include "platform.h"
#include <string>

namespace teeclip {

constexpr const char *NOTIFY_PROGRAM = "notify-send";

/**
 * @brief Run notify-send with @p summary and @p body
 *
 * Looks the program up on PATH and waits for it. Callers are expected to
 * ignore the result; it is returned for logging and tests.
 */
TEECLIP_API Result<void> send_notification(const std::string &summary,
                                           const std::string &body);

} // namespace teeclip

#endif // TEECLIP_NOTIFY_H
