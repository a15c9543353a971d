/**
 * @file test_pipeline.cpp
 * @brief End-to-end tests for capture -> clean -> file -> clipboard
 */

#include "test_support.h"
#include <csignal>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <teeclip/teeclip.h>

using namespace teeclip;
using namespace teeclip_test;

class PipelineTest : public ::testing::Test {
protected:
  TempDir dir;
  TempDir bin;

  void SetUp() override {
    std::signal(SIGPIPE, SIG_IGN);
    write_file(tty(), "");
    config.load_defaults();
    config.tty_path = tty();
  }

  fs::path tty() const { return dir / "tty"; }
  fs::path mirror() const { return dir / "stdout"; }

  /// Run with @p input on "stdin"; stdout goes to mirror()
  Result<PipelineReport> run(const std::string &input) {
    write_file(dir / "stdin", input);
    FileFd in(dir / "stdin", O_RDONLY);
    FileFd out(mirror(), O_WRONLY | O_CREAT | O_TRUNC);

    PipelineIo io;
    io.input_fd = in.get();
    io.output_fd = out.get();
    DiscoveryEnvironment env;
    env.search_path = bin.path().string();
    env.x_display = ":0";
    io.discovery = env;

    return run_pipeline(config, io);
  }

  TeeclipConfig config;
};

TEST_F(PipelineTest, MirrorsRawAndCopiesClean) {
  const std::string input = "\x1b[31mHELLO\x1b[0m\n";
  auto result = run(input);
  ASSERT_TRUE(result.is_ok()) << result.error().to_string();

  const auto &report = result.value();
  EXPECT_EQ(report.bytes_read, input.size());
  EXPECT_EQ(report.content_size, 6u);
  EXPECT_TRUE(report.copied);
  EXPECT_EQ(report.transport, Transport::Osc52);

  // stdout sees the raw bytes, the clipboard the cleaned ones
  EXPECT_EQ(read_file(mirror()), input);
  EXPECT_EQ(read_file(tty()), build_osc52_sequence("HELLO\n").value());
}

TEST_F(PipelineTest, HelperReceivesCleanContent) {
  write_recording_helper(bin.path(), "xclip");
  config.trim = true;

  auto result = run("\x1b[1m  build ok  \x1b[0m\n");
  ASSERT_TRUE(result.is_ok()) << result.error().to_string();
  EXPECT_EQ(result.value().transport, Transport::Helper);
  EXPECT_EQ(read_file(bin / "xclip.stdin"), "build ok");
  EXPECT_TRUE(read_file(tty()).empty());
}

TEST_F(PipelineTest, ForcedOsc52SkipsHelper) {
  write_recording_helper(bin.path(), "xclip");
  config.force_osc52 = true;

  auto result = run("abc");
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().transport, Transport::Osc52);
  EXPECT_FALSE(fs::exists(bin / "xclip.args"));
}

TEST_F(PipelineTest, QuietSuppressesMirror) {
  config.quiet = true;
  auto result = run("secret\n");
  ASSERT_TRUE(result.is_ok());
  EXPECT_TRUE(read_file(mirror()).empty());
  EXPECT_TRUE(result.value().copied);
}

TEST_F(PipelineTest, NoStripKeepsEscapes) {
  config.strip_ansi = false;
  const std::string input = "\x1b[32mgreen\x1b[0m";
  auto result = run(input);
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(read_file(tty()), build_osc52_sequence(input).value());
}

TEST_F(PipelineTest, FileGetsCleanContent) {
  config.output_file = dir / "out.log";
  auto result = run("\x1b[31mred\x1b[0m\n");
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().bytes_saved, 4u);
  EXPECT_EQ(read_file(dir / "out.log"), "red\n");
}

TEST_F(PipelineTest, AppendMode) {
  config.output_file = dir / "out.log";
  config.append = true;
  write_file(dir / "out.log", "first\n");

  ASSERT_TRUE(run("second\n").is_ok());
  EXPECT_EQ(read_file(dir / "out.log"), "first\nsecond\n");
}

TEST_F(PipelineTest, FileOnlyNeverTouchesClipboard) {
  write_recording_helper(bin.path(), "xclip");
  config.output_file = dir / "out.log";
  config.copy_to_clipboard = false;

  auto result = run("only file");
  ASSERT_TRUE(result.is_ok());
  EXPECT_FALSE(result.value().copied);
  EXPECT_EQ(read_file(dir / "out.log"), "only file");
  EXPECT_FALSE(fs::exists(bin / "xclip.args"));
  EXPECT_TRUE(read_file(tty()).empty());
}

TEST_F(PipelineTest, EmptyAfterCleaningDoesNothing) {
  config.output_file = dir / "out.log";
  config.trim = true;

  auto result = run("\x1b[0m \n\t\n");
  ASSERT_TRUE(result.is_ok());
  EXPECT_TRUE(result.value().nothing_to_copy);
  EXPECT_FALSE(result.value().copied);
  EXPECT_FALSE(fs::exists(dir / "out.log"));
  EXPECT_TRUE(read_file(tty()).empty());
}

TEST_F(PipelineTest, EmptyInput) {
  auto result = run("");
  ASSERT_TRUE(result.is_ok());
  EXPECT_TRUE(result.value().nothing_to_copy);
}

TEST_F(PipelineTest, FileKeptWhenClipboardFails) {
  config.output_file = dir / "out.log";
  config.tty_path = dir / "missing" / "tty";

  auto result = run("keep me");
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ClipboardUnavailable);
  EXPECT_EQ(read_file(dir / "out.log"), "keep me");
}

TEST_F(PipelineTest, FileErrorStopsBeforeClipboard) {
  config.output_file = dir / "missing" / "out.log";

  auto result = run("data");
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::FileWriteError);
  EXPECT_TRUE(read_file(tty()).empty());
}

TEST_F(PipelineTest, OversizedInputTruncated) {
  std::string input(MAX_CONTENT_SIZE + 1000, 'x');
  config.quiet = true;
  config.copy_to_clipboard = false;
  config.output_file = dir / "out.log";

  auto result = run(input);
  ASSERT_TRUE(result.is_ok());
  EXPECT_TRUE(result.value().input_truncated);
  EXPECT_EQ(result.value().bytes_read, MAX_CONTENT_SIZE);
  EXPECT_EQ(fs::file_size(dir / "out.log"), MAX_CONTENT_SIZE);
}

TEST_F(PipelineTest, InputOfExactlyTenMiBNotTruncated) {
  config.quiet = true;
  config.copy_to_clipboard = false;
  config.output_file = dir / "out.log";

  auto result = run(std::string(MAX_CONTENT_SIZE, 'x'));
  ASSERT_TRUE(result.is_ok());
  EXPECT_FALSE(result.value().input_truncated);
  EXPECT_EQ(result.value().bytes_read, MAX_CONTENT_SIZE);
}

TEST_F(PipelineTest, InvalidConfigRejected) {
  config.copy_to_clipboard = false;
  config.force_osc52 = true;
  auto result = run("x");
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(PipelineTest, TerminalInputRejected) {
  FileFd null_dev("/dev/null", O_RDONLY);
  PipelineIo io;
  io.input_fd = null_dev.get();
  auto result = run_pipeline(config, io);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::NoPipedInput);
}
