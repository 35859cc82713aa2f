/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "devcat/config.hpp"
#include <gtest/gtest.h>
#include <map>
#include <memory>

using namespace devcat;

namespace {

// Environment stand-in so tests never see the real one.
EnvLookup envOf(std::map<std::string, std::string> values) {
    auto shared = std::make_shared<const std::map<std::string, std::string>>(std::move(values));
    return [shared](const char* name) -> const char* {
        auto it = shared->find(name);
        return it == shared->end() ? nullptr : it->second.c_str();
    };
}

const EnvLookup kTokenEnv = envOf({{"DEVCAT_ACCESS_TOKEN", "tok"}});

}

TEST(ConfigTest, DefaultsWithPositionalFile) {
    auto result = parseArgs({"devices.csv"}, kTokenEnv);

    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.action, CliAction::Run);
    EXPECT_EQ(result.config.inputPath, "devices.csv");
    EXPECT_EQ(result.config.maxRetries, 5);
    EXPECT_EQ(result.config.pollInterval, std::chrono::seconds(10));
    EXPECT_EQ(result.config.jobs, 1);
    EXPECT_EQ(result.config.accessToken, "tok");
    EXPECT_EQ(result.config.graphUrl, "https://graph.microsoft.com/beta");
    EXPECT_FALSE(result.config.logLevel.has_value());
}

TEST(ConfigTest, FlagsOverrideEnvironment) {
    EnvLookup env = envOf({
        {"DEVCAT_ACCESS_TOKEN", "tok"},
        {"DEVCAT_MAX_RETRIES", "3"},
        {"DEVCAT_JOBS", "2"},
    });

    auto result = parseArgs({"--file", "in.csv", "--retries", "0", "-j", "8", "--interval", "2", "-q"},
                            env);

    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.config.inputPath, "in.csv");
    EXPECT_EQ(result.config.maxRetries, 0);
    EXPECT_EQ(result.config.jobs, 8);
    EXPECT_EQ(result.config.pollInterval, std::chrono::seconds(2));
    ASSERT_TRUE(result.config.logLevel.has_value());
    EXPECT_EQ(*result.config.logLevel, LogLevel::WARN);
}

TEST(ConfigTest, EnvironmentSuppliesClientCredentials) {
    EnvLookup env = envOf({
        {"DEVCAT_TENANT_ID", "t1"},
        {"DEVCAT_CLIENT_ID", "c1"},
        {"DEVCAT_CLIENT_SECRET", "s1"},
        {"DEVCAT_MAX_RETRIES", "7"},
    });

    auto result = parseArgs({"devices.csv"}, env);

    ASSERT_TRUE(result) << result.error;
    EXPECT_TRUE(result.config.accessToken.empty());
    EXPECT_TRUE(result.config.credentials.complete());
    EXPECT_EQ(result.config.credentials.tenantId, "t1");
    EXPECT_EQ(result.config.maxRetries, 7);
}

TEST(ConfigTest, MissingCredentialsIsAnError) {
    EnvLookup env = envOf({{"DEVCAT_TENANT_ID", "t1"}});

    auto result = parseArgs({"devices.csv", "--client-id", "c1"}, env);

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("credentials"), std::string::npos);
}

TEST(ConfigTest, MissingFileIsAnError) {
    auto result = parseArgs({"--retries", "2"}, kTokenEnv);
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("input file"), std::string::npos);
}

TEST(ConfigTest, RejectsBadNumbers) {
    EXPECT_FALSE(parseArgs({"a.csv", "--retries", "-1"}, kTokenEnv));
    EXPECT_FALSE(parseArgs({"a.csv", "--retries", "two"}, kTokenEnv));
    EXPECT_FALSE(parseArgs({"a.csv", "--jobs", "0"}, kTokenEnv));
    EXPECT_FALSE(parseArgs({"a.csv", "--retries"}, kTokenEnv));

    EnvLookup env = envOf({{"DEVCAT_ACCESS_TOKEN", "tok"}, {"DEVCAT_POLL_INTERVAL", "10s"}});
    auto result = parseArgs({"a.csv"}, env);
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("DEVCAT_POLL_INTERVAL"), std::string::npos);
}

TEST(ConfigTest, RejectsUnknownOptionsAndExtraArguments) {
    EXPECT_FALSE(parseArgs({"a.csv", "--frobnicate"}, kTokenEnv));
    EXPECT_FALSE(parseArgs({"a.csv", "b.csv"}, kTokenEnv));
}

TEST(ConfigTest, HelpAndVersionShortCircuit) {
    auto help = parseArgs({"--bogus", "-h"}, envOf({}));
    ASSERT_TRUE(help);
    EXPECT_EQ(help.action, CliAction::Help);

    auto version = parseArgs({"--version"}, envOf({}));
    ASSERT_TRUE(version);
    EXPECT_EQ(version.action, CliAction::Version);
}
