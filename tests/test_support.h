/**
 * @file test_support.h
 * @brief Shared fixtures: temporary directories, fake helper scripts, files
 */

#ifndef TEECLIP_TESTS_TEST_SUPPORT_H
#define TEECLIP_TESTS_TEST_SUPPORT_H

#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace teeclip_test {

namespace fs = std::filesystem;

/**
 * @brief Directory under the system temp dir, removed on destruction
 */
class TempDir {
public:
  TempDir() {
    std::string tmpl =
        (fs::temp_directory_path() / "teeclip_test_XXXXXX").string();
    char *made = ::mkdtemp(&tmpl[0]);
    path_ = made ? fs::path(made) : fs::path();
  }

  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }

  fs::path operator/(const std::string &name) const { return path_ / name; }

private:
  fs::path path_;
};

inline void write_file(const fs::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

/**
 * @brief Write an executable /bin/sh script named @p name into @p dir
 */
inline fs::path write_script(const fs::path &dir, const std::string &name,
                             const std::string &body) {
  fs::path path = dir / name;
  write_file(path, "#!/bin/sh\n" + body + "\n");
  ::chmod(path.c_str(), 0755);
  return path;
}

/**
 * @brief Helper that records its argv (one per line) and stdin, then exits
 *        with @p exit_code
 */
inline fs::path write_recording_helper(const fs::path &dir,
                                       const std::string &name,
                                       int exit_code = 0) {
  std::string rec = (dir / (name + ".args")).string();
  std::string in = (dir / (name + ".stdin")).string();
  return write_script(dir, name,
                      "printf '%s\\n' \"$@\" > '" + rec + "'\n" +
                          "cat > '" + in + "'\n" + "exit " +
                          std::to_string(exit_code));
}

/// Changes the working directory, restoring the previous one on destruction
class ScopedCwd {
public:
  explicit ScopedCwd(const fs::path &dir) : previous_(fs::current_path()) {
    fs::current_path(dir);
  }
  ~ScopedCwd() {
    std::error_code ec;
    fs::current_path(previous_, ec);
  }

  ScopedCwd(const ScopedCwd &) = delete;
  ScopedCwd &operator=(const ScopedCwd &) = delete;

private:
  fs::path previous_;
};

/// Descriptor opened on a regular file, closed on destruction
class FileFd {
public:
  FileFd(const fs::path &path, int flags, mode_t mode = 0644)
      : fd_(::open(path.c_str(), flags | O_CLOEXEC, mode)) {}
  ~FileFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  FileFd(const FileFd &) = delete;
  FileFd &operator=(const FileFd &) = delete;

  int get() const { return fd_; }

private:
  int fd_;
};

} // namespace teeclip_test

#endif // TEECLIP_TESTS_TEST_SUPPORT_H
