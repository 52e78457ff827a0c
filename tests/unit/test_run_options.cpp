/**
 * @file test_run_options.cpp
 * @brief Unit tests for RunOptions.
 */

#include "core/run_options.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>

using namespace taskpipe;

TEST(RunOptionsTest, EmptyByDefault) {
    RunOptions options;
    EXPECT_TRUE(options.empty());
    EXPECT_FALSE(options.contains("anything"));
    EXPECT_EQ(options.find<int>("anything"), nullptr);
}

TEST(RunOptionsTest, SetAndGet) {
    RunOptions options;
    options.set("retries", 3).set("bucket", std::string{"s3://data"});

    EXPECT_EQ(options.size(), 2u);
    ASSERT_TRUE(options.get<int>("retries").has_value());
    EXPECT_EQ(*options.get<int>("retries"), 3);
    EXPECT_EQ(*options.get<std::string>("bucket"), "s3://data");
}

TEST(RunOptionsTest, GetMissingOrMistyped) {
    RunOptions options;
    options.set("retries", 3);

    auto missing = options.get<int>("timeout");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, ErrorKind::Config);

    auto mistyped = options.get<std::string>("retries");
    ASSERT_FALSE(mistyped.has_value());
    EXPECT_NE(mistyped.error().message.find("another type"), std::string::npos);
}

TEST(RunOptionsTest, SetReplaces) {
    RunOptions options;
    options.set("level", 1);
    options.set("level", 2);
    EXPECT_EQ(options.size(), 1u);
    EXPECT_EQ(options.get_or("level", 0), 2);
}

TEST(RunOptionsTest, SharedObjectsAreForwardedByHandle) {
    auto counter = std::make_shared<int>(0);
    RunOptions options;
    options.set("counter", counter);

    const auto* stored = options.find<std::shared_ptr<int>>("counter");
    ASSERT_NE(stored, nullptr);
    **stored = 5;
    EXPECT_EQ(*counter, 5);
}

TEST(RunOptionsTest, NamesAreSorted) {
    RunOptions options;
    options.set("b", 1).set("a", 2);
    auto names = options.names();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "a");
    EXPECT_EQ(names[1], "b");
}
