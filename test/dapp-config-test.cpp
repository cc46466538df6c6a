#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "dapp-config.h"

using namespace dapp;

class DappConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        (void) unsetenv(DISPATCHER_URL_ENV);
    }

    void TearDown() override {
        (void) unsetenv(DISPATCHER_URL_ENV);
    }

    bool parse(std::vector<std::string> args) {
        args_ = std::move(args);
        args_.insert(args_.begin(), "echo-dapp");
        argv_.clear();
        for (auto &a : args_) {
            argv_.push_back(a.data());
        }
        return parse_dapp_config(static_cast<int>(argv_.size()), argv_.data(), config_);
    }

    std::vector<std::string> args_;
    std::vector<char *> argv_;
    dapp_config_type config_;
};

/**
 * @given no arguments and no environment
 * @when the configuration is parsed
 * @then no outputs are emitted and the default dispatcher is used
 */
TEST_F(DappConfigTest, Defaults) {
    ASSERT_TRUE(parse({}));
    EXPECT_EQ(config_.echo.vouchers, 0);
    EXPECT_EQ(config_.echo.notices, 0);
    EXPECT_EQ(config_.echo.reports, 0);
    EXPECT_EQ(config_.dispatcher_url, DEFAULT_DISPATCHER_URL);
    EXPECT_EQ(config_.timeout_ms, 0);
    EXPECT_FALSE(config_.help);
}

/**
 * @given all options on the command line
 * @when the configuration is parsed
 * @then every value is taken from its option
 */
TEST_F(DappConfigTest, ParsesOptions) {
    ASSERT_TRUE(parse({"--vouchers=3", "--notices=2", "--reports=1", "--dispatcher-url=http://dispatcher:8080",
        "--timeout-ms=500"}));
    EXPECT_EQ(config_.echo.vouchers, 3);
    EXPECT_EQ(config_.echo.notices, 2);
    EXPECT_EQ(config_.echo.reports, 1);
    EXPECT_EQ(config_.dispatcher_url, "http://dispatcher:8080");
    EXPECT_EQ(config_.timeout_ms, 500);
}

/**
 * @given a dispatcher URL in the environment
 * @when the configuration is parsed with and without --dispatcher-url
 * @then the option takes precedence over the environment
 */
TEST_F(DappConfigTest, ReadsDispatcherUrlFromEnvironment) {
    ASSERT_EQ(setenv(DISPATCHER_URL_ENV, "http://env:5004", 1), 0);
    ASSERT_TRUE(parse({}));
    EXPECT_EQ(config_.dispatcher_url, "http://env:5004");
    ASSERT_TRUE(parse({"--dispatcher-url=http://cli:5004"}));
    EXPECT_EQ(config_.dispatcher_url, "http://cli:5004");
}

/**
 * @given arguments that are unknown or carry bad values
 * @when the configuration is parsed
 * @then parsing fails
 */
TEST_F(DappConfigTest, RejectsInvalidArguments) {
    EXPECT_FALSE(parse({"--frobnicate"}));
    EXPECT_FALSE(parse({"--vouchers=three"}));
    EXPECT_FALSE(parse({"--notices=2x"}));
    EXPECT_FALSE(parse({"--dispatcher-url="}));
    EXPECT_FALSE(parse({"--reports"}));
}

/**
 * @given negative or signed counts
 * @when the configuration is parsed
 * @then parsing fails instead of wrapping the value around
 */
TEST_F(DappConfigTest, RejectsSignedNumbers) {
    EXPECT_FALSE(parse({"--vouchers=-1"}));
    EXPECT_FALSE(parse({"--notices=+2"}));
    EXPECT_FALSE(parse({"--reports= 3"}));
    EXPECT_FALSE(parse({"--timeout-ms=-100"}));
    ASSERT_TRUE(parse({"--vouchers=18446744073709551615"}));
    EXPECT_EQ(config_.echo.vouchers, UINT64_MAX);
}

/**
 * @given --help
 * @when the configuration is parsed
 * @then help is requested
 */
TEST_F(DappConfigTest, RequestsHelp) {
    ASSERT_TRUE(parse({"--reports=1", "--help"}));
    EXPECT_TRUE(config_.help);
    EXPECT_EQ(config_.echo.reports, 1);
}
