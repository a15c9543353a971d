/**
 * @file file_sink.h
 * @brief Saving cleaned content to a file
 */

#ifndef TEECLIP_FILE_SINK_H
#define TEECLIP_FILE_SINK_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <filesystem>

namespace teeclip {

/**
 * @brief How an existing file is treated
 */
enum class WriteMode : uint8_t {
  /// Create or truncate
  Truncate = 0,

  /// Create or append
  Append = 1
};

/**
 * @brief Write @p content to @p path in a single pass
 *
 * @return Number of bytes written, or FileWriteError
 */
TEECLIP_API Result<size_t> write_to_file(const std::filesystem::path &path,
                                         const Content &content,
                                         WriteMode mode = WriteMode::Truncate);

} // namespace teeclip

#endif // TEECLIP_FILE_SINK_H
