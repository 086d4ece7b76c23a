#include "util.hpp"
#include "test_support.hpp"

#include <cstdio>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <unistd.h>

#include "gtest/gtest.h"

namespace {

std::string write_temp_file(const std::string& contents) {
    char path[] = "/tmp/archiver_dotenv_XXXXXX";
    int fd = mkstemp(path);
    if (fd == -1) {
        throw std::runtime_error("mkstemp failed");
    }
    close(fd);

    std::ofstream out(path);
    out << contents;
    return path;
}

} // namespace

TEST(UtilTest, RequiredEnvVarThrowsWhenUnset) {
    ScopedEnv unset{"ARCHIVER_TEST_REQUIRED", nullptr};
    EXPECT_THROW(util::get_required_env_var("ARCHIVER_TEST_REQUIRED"), std::runtime_error);
}

TEST(UtilTest, EnvVarFallsBackToDefault) {
    ScopedEnv unset{"ARCHIVER_TEST_OPTIONAL", nullptr};
    EXPECT_EQ(util::get_env_var("ARCHIVER_TEST_OPTIONAL", "fallback"), "fallback");

    ScopedEnv set{"ARCHIVER_TEST_OPTIONAL", "value"};
    EXPECT_EQ(util::get_env_var("ARCHIVER_TEST_OPTIONAL", "fallback"), "value");
}

TEST(UtilTest, SplitAndTrim) {
    auto parts = util::split_string("a,,b,c", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "b");

    EXPECT_EQ(util::trim("  San Diego \t"), "San Diego");
    EXPECT_EQ(util::trim("   "), "");
}

TEST(UtilTest, ArchiveTimestampFormat) {
    auto stamp = util::format_archive_timestamp(fixed_time());

    EXPECT_EQ(stamp, "20231114-221320");
    EXPECT_TRUE(std::regex_match(stamp, std::regex(R"(\d{8}-\d{6})")));
}

TEST(UtilTest, MeasurementKeepsOneDecimalForWholeNumbers) {
    EXPECT_EQ(util::format_measurement(72.0), "72.0");
    EXPECT_EQ(util::format_measurement(70.5), "70.5");
    EXPECT_EQ(util::format_measurement(-3.25), "-3.25");
}

TEST(UtilTest, HttpErrorClassification) {
    EXPECT_TRUE(util::is_http_error(0));
    EXPECT_TRUE(util::is_http_error(401));
    EXPECT_TRUE(util::is_http_error(404));
    EXPECT_TRUE(util::is_http_error(503));
    EXPECT_FALSE(util::is_http_error(200));
    EXPECT_FALSE(util::is_http_error(204));
}

TEST(DotenvTest, LoadsUnsetVariables) {
    ScopedEnv a{"ARCHIVER_DOTENV_A", nullptr};
    ScopedEnv b{"ARCHIVER_DOTENV_B", nullptr};
    ScopedEnv c{"ARCHIVER_DOTENV_C", nullptr};

    auto path = write_temp_file(
        "# secrets\n"
        "\n"
        "ARCHIVER_DOTENV_A=plain\n"
        "export ARCHIVER_DOTENV_B=\"quoted value\"\n"
        "ARCHIVER_DOTENV_C='single'\n"
        "not a pair\n");

    EXPECT_EQ(util::load_dotenv(path), 3);
    EXPECT_EQ(util::get_env_var("ARCHIVER_DOTENV_A"), "plain");
    EXPECT_EQ(util::get_env_var("ARCHIVER_DOTENV_B"), "quoted value");
    EXPECT_EQ(util::get_env_var("ARCHIVER_DOTENV_C"), "single");

    std::remove(path.c_str());
}

TEST(DotenvTest, ExistingEnvironmentWins) {
    ScopedEnv a{"ARCHIVER_DOTENV_A", "from-env"};

    auto path = write_temp_file("ARCHIVER_DOTENV_A=from-file\n");

    EXPECT_EQ(util::load_dotenv(path), 0);
    EXPECT_EQ(util::get_env_var("ARCHIVER_DOTENV_A"), "from-env");

    std::remove(path.c_str());
}

TEST(DotenvTest, MissingFileIsNotAnError) {
    EXPECT_EQ(util::load_dotenv("/nonexistent/archiver/.env"), 0);
}

TEST(DotenvTest, InlineCommentIsStripped) {
    ScopedEnv a{"ARCHIVER_DOTENV_A", nullptr};
    ScopedEnv b{"ARCHIVER_DOTENV_B", nullptr};

    auto path = write_temp_file(
        "ARCHIVER_DOTENV_A=abc123   # personal key\n"
        "ARCHIVER_DOTENV_B=no#comment\n");

    EXPECT_EQ(util::load_dotenv(path), 2);
    EXPECT_EQ(util::get_env_var("ARCHIVER_DOTENV_A"), "abc123");
    EXPECT_EQ(util::get_env_var("ARCHIVER_DOTENV_B"), "no#comment");

    std::remove(path.c_str());
}

TEST(DotenvTest, QuotedValueKeepsHash) {
    ScopedEnv a{"ARCHIVER_DOTENV_A", nullptr};
    ScopedEnv b{"ARCHIVER_DOTENV_B", nullptr};

    auto path = write_temp_file(
        "ARCHIVER_DOTENV_A=\"abc # 123\"\n"
        "ARCHIVER_DOTENV_B='x #y'   # trailing note\n");

    EXPECT_EQ(util::load_dotenv(path), 2);
    EXPECT_EQ(util::get_env_var("ARCHIVER_DOTENV_A"), "abc # 123");
    EXPECT_EQ(util::get_env_var("ARCHIVER_DOTENV_B"), "x #y");

    std::remove(path.c_str());
}

TEST(UtilTest, LogLevelParsing) {
    EXPECT_EQ(util::parse_log_level("debug").value_or(spdlog::level::trace), spdlog::level::debug);
    EXPECT_EQ(util::parse_log_level("error").value_or(spdlog::level::trace), spdlog::level::err);
    EXPECT_EQ(util::parse_log_level("off").value_or(spdlog::level::trace), spdlog::level::off);
    EXPECT_FALSE(util::parse_log_level("verbose").has_value());
    EXPECT_FALSE(util::parse_log_level("").has_value());
}

TEST(UtilTest, StorageErrorWithoutBodyUsesHttpStatus) {
    EXPECT_EQ(util::describe_storage_error("", "", 403), "HTTP 403");
    EXPECT_EQ(util::describe_storage_error("", "Forbidden", 403), "HTTP 403: Forbidden");
    EXPECT_EQ(util::describe_storage_error("AccessDenied", "Access Denied", 403),
              "AccessDenied: Access Denied");
    EXPECT_EQ(util::describe_storage_error("NoSuchBucket", "", 404), "NoSuchBucket");
}
