/**
 * @file file_sink.cpp
 * @brief File output
 */

#include "teeclip/file_sink.h"
#include "teeclip/log.h"
#include <cerrno>
#include <cstring>
#include <fstream>

namespace teeclip {

Result<size_t> write_to_file(const std::filesystem::path &path,
                             const Content &content, WriteMode mode) {
  if (path.empty()) {
    return Error(ErrorCode::InvalidArgument, "output file path is empty");
  }

  auto flags = std::ios::out | std::ios::binary;
  flags |= (mode == WriteMode::Append) ? std::ios::app : std::ios::trunc;

  std::ofstream file(path, flags);
  if (!file) {
    return Error(ErrorCode::FileWriteError, "open file " + path.string(),
                 std::strerror(errno));
  }

  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  file.close();
  if (file.fail()) {
    return Error(ErrorCode::FileWriteError, "write file " + path.string(),
                 std::strerror(errno));
  }

  logging::diag()->debug("{} {} bytes to {}",
                         mode == WriteMode::Append ? "appended" : "wrote",
                         content.size(), path.string());
  return content.size();
}

} // namespace teeclip
