/**
 * @file test_helper_discovery.cpp
 * @brief Unit tests for clipboard helper lookup and invocation
 */

#include "test_support.h"
#include <csignal>
#include <gtest/gtest.h>
#include <teeclip/helper.h>

using namespace teeclip;
using namespace teeclip_test;

class HelperDiscoveryTest : public ::testing::Test {
protected:
  TempDir bin;

  void SetUp() override { std::signal(SIGPIPE, SIG_IGN); }

  void install(const std::string &name) {
    write_script(bin.path(), name, "exit 0");
  }

  DiscoveryEnvironment env(const std::string &wayland,
                           const std::string &x11) const {
    DiscoveryEnvironment e;
    e.wayland_display = wayland;
    e.x_display = x11;
    e.search_path = bin.path().string();
    return e;
  }
};

// ============================================================================
// find_executable
// ============================================================================

TEST_F(HelperDiscoveryTest, FindsExecutableOnPath) {
  install("xclip");
  auto found = find_executable("xclip", "/nonexistent:" + bin.path().string());
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, (bin / "xclip").string());
}

TEST_F(HelperDiscoveryTest, SkipsNonExecutableAndDirectories) {
  write_file(bin / "xclip", "#!/bin/sh\n");
  fs::create_directory(bin / "xsel");
  EXPECT_FALSE(find_executable("xclip", bin.path().string()).has_value());
  EXPECT_FALSE(find_executable("xsel", bin.path().string()).has_value());
}

TEST_F(HelperDiscoveryTest, NameWithSlashCheckedDirectly) {
  install("wl-copy");
  auto path = (bin / "wl-copy").string();
  EXPECT_EQ(find_executable(path, "").value_or(""), path);
  EXPECT_FALSE(find_executable((bin / "missing").string(), "").has_value());
}

TEST_F(HelperDiscoveryTest, WorkingDirectoryNeverSearched) {
  install("xclip");
  ScopedCwd cwd(bin.path());
  EXPECT_FALSE(find_executable("xclip", "").has_value());
  EXPECT_FALSE(find_executable("xclip", "/nonexistent:").has_value());
  EXPECT_FALSE(find_executable("xclip", ":/nonexistent").has_value());
  EXPECT_FALSE(find_executable("xclip", ".").has_value());
  EXPECT_FALSE(find_executable("xclip", "/nonexistent::/also-missing")
                   .has_value());
}

TEST_F(HelperDiscoveryTest, EmptyPathDiscoversNothing) {
  install("xclip");
  install("wl-copy");
  ScopedCwd cwd(bin.path());

  DiscoveryEnvironment e;
  e.x_display = ":0";
  e.search_path = "";
  EXPECT_FALSE(discover_helper(e).has_value());

  e.search_path = "/nonexistent:";
  EXPECT_FALSE(discover_helper(e).has_value());
}

TEST_F(HelperDiscoveryTest, EmptyNameNotFound) {
  EXPECT_FALSE(find_executable("", bin.path().string()).has_value());
}

// ============================================================================
// discover_helper
// ============================================================================

TEST_F(HelperDiscoveryTest, WaylandUsesWlCopyOneShot) {
  install("wl-copy");
  install("xclip");
  auto helper = discover_helper(env("wayland-0", ":0"));
  ASSERT_TRUE(helper.has_value());
  EXPECT_EQ(helper->name(), "wl-copy");
  EXPECT_TRUE(helper->one_shot_required);
  EXPECT_TRUE(helper->args.empty());
}

TEST_F(HelperDiscoveryTest, WaylandWithoutWlCopyFallsToX11) {
  install("xclip");
  auto helper = discover_helper(env("wayland-0", ":0"));
  ASSERT_TRUE(helper.has_value());
  EXPECT_EQ(helper->name(), "xclip");
}

TEST_F(HelperDiscoveryTest, WaylandOnlyNeverPicksX11Helper) {
  install("xclip");
  install("xsel");
  EXPECT_FALSE(discover_helper(env("wayland-0", "")).has_value());
}

TEST_F(HelperDiscoveryTest, X11PrefersXclip) {
  install("xclip");
  install("xsel");
  auto helper = discover_helper(env("", ":0"));
  ASSERT_TRUE(helper.has_value());
  EXPECT_EQ(helper->name(), "xclip");
  EXPECT_EQ(helper->args,
            (std::vector<std::string>{"-selection", "clipboard"}));
  EXPECT_FALSE(helper->one_shot_required);
}

TEST_F(HelperDiscoveryTest, X11FallsBackToXsel) {
  install("xsel");
  auto helper = discover_helper(env("", ":0"));
  ASSERT_TRUE(helper.has_value());
  EXPECT_EQ(helper->name(), "xsel");
  EXPECT_EQ(helper->args, (std::vector<std::string>{"--clipboard", "--input"}));
}

TEST_F(HelperDiscoveryTest, NoSessionTriesWlCopy) {
  install("wl-copy");
  auto helper = discover_helper(env("", ""));
  ASSERT_TRUE(helper.has_value());
  EXPECT_EQ(helper->name(), "wl-copy");
  EXPECT_TRUE(helper->one_shot_required);
}

TEST_F(HelperDiscoveryTest, NoSessionIgnoresX11Helpers) {
  install("xclip");
  EXPECT_FALSE(discover_helper(env("", "")).has_value());
}

TEST_F(HelperDiscoveryTest, NothingInstalled) {
  EXPECT_FALSE(discover_helper(env("wayland-0", ":0")).has_value());
}

// ============================================================================
// HelperDescriptor / invoke_helper
// ============================================================================

TEST(HelperDescriptorTest, OneShotFlagComesFirst) {
  HelperDescriptor helper;
  helper.path = "/usr/bin/wl-copy";
  helper.args = {"--type", "text/plain"};
  helper.one_shot_required = true;

  EXPECT_EQ(helper.name(), "wl-copy");
  EXPECT_EQ(helper.invocation_args(),
            (std::vector<std::string>{"--paste-once", "--type", "text/plain"}));

  helper.one_shot_required = false;
  EXPECT_EQ(helper.invocation_args(),
            (std::vector<std::string>{"--type", "text/plain"}));
}

TEST_F(HelperDiscoveryTest, InvokePassesOneShotFlagAndContent) {
  write_recording_helper(bin.path(), "wl-copy");
  auto helper = discover_helper(env("wayland-0", ""));
  ASSERT_TRUE(helper.has_value());

  ASSERT_TRUE(invoke_helper(*helper, "copied text").is_ok());
  EXPECT_EQ(read_file(bin / "wl-copy.args"), "--paste-once\n");
  EXPECT_EQ(read_file(bin / "wl-copy.stdin"), "copied text");
}

TEST_F(HelperDiscoveryTest, InvokeReportsExitAndStderr) {
  write_script(bin.path(), "xclip",
               "cat >/dev/null\necho \"Error: Can't open display\" >&2\nexit 1");
  auto helper = discover_helper(env("", ":0"));
  ASSERT_TRUE(helper.has_value());

  auto result = invoke_helper(*helper, "data");
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::HelperExitError);
  EXPECT_EQ(result.error().message, "xclip failed: exit status 1");
  EXPECT_EQ(result.error().details, "Error: Can't open display");
}

TEST_F(HelperDiscoveryTest, InvokeReportsEarlyExitAsWriteError) {
  write_script(bin.path(), "xsel", "exit 0");
  auto helper = discover_helper(env("", ":0"));
  ASSERT_TRUE(helper.has_value());

  auto result = invoke_helper(*helper, std::string(1024 * 1024, 'z'));
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::HelperWriteError);
}
