/*
 * test_output_limiter.cpp - Tests for output size limits
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <string>

#include "network/output_limiter.hpp"

using namespace netfleet::network;
using netfleet::config::OutputConfig;

class OutputLimiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.summaryThreshold = 100;
        config_.maxLength = 500;
    }

    OutputConfig config_;
};

TEST_F(OutputLimiterTest, ShortOutputUnchanged) {
    OutputLimiter limiter(config_);
    std::string output(100, 'x');
    EXPECT_EQ(limiter.apply("show version", output), output);
}

TEST_F(OutputLimiterTest, MediumOutputShortenedToThreshold) {
    OutputLimiter limiter(config_);
    auto result = limiter.apply("show tech", std::string(300, 'x'));

    EXPECT_EQ(result.substr(0, 100), std::string(100, 'x'));
    EXPECT_EQ(result[100], '\n');
    EXPECT_NE(result.find("[Output shortened: showing first 100 of 300"),
              std::string::npos);
}

TEST_F(OutputLimiterTest, LongOutputTruncatedToMax) {
    OutputLimiter limiter(config_);
    auto result = limiter.apply("show tech", std::string(1000, 'x'));

    EXPECT_EQ(result.substr(0, 500), std::string(500, 'x'));
    EXPECT_NE(result.find("[Output truncated: showing first 500 of 1000"),
              std::string::npos);
}

TEST(OutputLimiterDefaultsTest, DefaultThresholds) {
    OutputLimiter limiter;
    std::string output(10000, 'y');
    EXPECT_EQ(limiter.apply("show run", output).size(), 10000u);
    EXPECT_GT(limiter.apply("show run", std::string(10001, 'y')).size(),
              10000u);
}
