#include <gtest/gtest.h>
#include "log.hpp"
#include "util.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
fs::path scratch(const std::string& name, const std::string& text) {
    auto p = fs::temp_directory_path() / ("agent-sdk-" + std::to_string(::getpid()) + "-" + name);
    std::ofstream f(p, std::ios::binary);
    f << text;
    return p;
}
}

// =============================================================================
// Strings and time
// =============================================================================

TEST(UtilTests, Trim_StripsWhitespaceOnly) {
    EXPECT_EQ(trim("  macro \r\n"), "macro");
    EXPECT_EQ(trim("\t"), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(UtilTests, Split_KeepsEmptyFields) {
    EXPECT_EQ(split("a,,b", ','), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_EQ(split("runs/abc/report", '/'), (std::vector<std::string>{"runs", "abc", "report"}));
}

TEST(UtilTests, IsSafeName_AllowsOnlyPlainNames) {
    EXPECT_TRUE(is_safe_name("20240501-120000-abcd0123"));
    EXPECT_TRUE(is_safe_name("macro_v2"));
    EXPECT_FALSE(is_safe_name(""));
    EXPECT_FALSE(is_safe_name(".."));
    EXPECT_FALSE(is_safe_name("/etc/x"));
    EXPECT_FALSE(is_safe_name("a/b"));
    EXPECT_FALSE(is_safe_name("a\\b"));
    EXPECT_FALSE(is_safe_name("a b"));
}

TEST(UtilTests, Format_UsesUtc) {
    auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(1714564800));
    EXPECT_EQ(format_utc(tp), "2024-05-01T12:00:00Z");
    EXPECT_EQ(format_compact(tp), "20240501-120000");
}

// =============================================================================
// Files and environment
// =============================================================================

TEST(UtilTests, Sha1File_MatchesKnownDigest) {
    auto p = scratch("abc.txt", "abc");
    EXPECT_EQ(sha1_file(p), "a9993e364706816aba3e25717850c26c9cd0d89d");
    fs::remove(p);
    EXPECT_THROW(sha1_file(p), std::runtime_error);
}

TEST(UtilTests, WriteTextFile_CreatesParentDirectories) {
    auto dir = fs::temp_directory_path() / ("agent-sdk-" + std::to_string(::getpid()) + "-nested");
    write_text_file(dir / "a" / "b.txt", "payload");
    EXPECT_EQ(read_text_file(dir / "a" / "b.txt"), "payload");
    fs::remove_all(dir);
}

TEST(UtilTests, LoadEnvFile_ExistingVariablesWin) {
    setenv("AGENT_SDK_TEST_KEEP", "original", 1);
    unsetenv("AGENT_SDK_TEST_NEW");
    auto p = scratch("test.env", "# comment\nAGENT_SDK_TEST_KEEP=from-file\nAGENT_SDK_TEST_NEW=\"quoted value\"\nnot a pair\n");

    auto pairs = load_env_file(p);
    EXPECT_EQ(pairs.size(), 2u);
    EXPECT_STREQ(std::getenv("AGENT_SDK_TEST_KEEP"), "original");
    EXPECT_STREQ(std::getenv("AGENT_SDK_TEST_NEW"), "quoted value");

    load_env_file(p, true);
    EXPECT_STREQ(std::getenv("AGENT_SDK_TEST_KEEP"), "from-file");
    EXPECT_TRUE(load_env_file(p.string() + ".missing").empty());
    fs::remove(p);
    unsetenv("AGENT_SDK_TEST_KEEP");
    unsetenv("AGENT_SDK_TEST_NEW");
}

TEST(UtilTests, GetenvIntOr_ParsesOrFallsBack) {
    unsetenv("AGENT_SDK_TEST_INT");
    EXPECT_EQ(getenv_int_or("AGENT_SDK_TEST_INT", 7), 7);
    setenv("AGENT_SDK_TEST_INT", "42", 1);
    EXPECT_EQ(getenv_int_or("AGENT_SDK_TEST_INT", 7), 42);
    setenv("AGENT_SDK_TEST_INT", "many", 1);
    EXPECT_THROW(getenv_int_or("AGENT_SDK_TEST_INT", 7), std::runtime_error);
    unsetenv("AGENT_SDK_TEST_INT");
}

TEST(UtilTests, ParseLogLevel_DefaultsToInfo) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::Info);
}
