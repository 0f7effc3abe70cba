//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: test_config.cpp
// Purpose: Configuration loading, validation and .env parsing
//==========================================================================================================

#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>

#include "env/EnvVars.h"
#include "flagbridge/Config.h"

using namespace flagbridge;

namespace {
ConfigLoader::EnvLookup envFrom(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        return it->second;
    };
}

std::map<std::string, std::string> validEnv() {
    return {{"UNLEASH_BASE_URL", "https://app.unleash-hosted.com//demo/"}, {"UNLEASH_PAT", "user:abc"}};
}
} // namespace

TEST(Config, LoadsAndNormalizes) {
    auto env = validEnv();
    env["UNLEASH_DEFAULT_PROJECT"] = "default";
    env["UNLEASH_DEFAULT_ENVIRONMENT"] = "development";
    Config cfg = ConfigLoader(envFrom(env)).Load({});

    EXPECT_EQ(cfg.remoteBaseUrl, "https://app.unleash-hosted.com/demo");
    EXPECT_EQ(cfg.accessToken, "user:abc");
    EXPECT_EQ(cfg.defaultProject.value_or(""), "default");
    EXPECT_EQ(cfg.defaultEnvironment.value_or(""), "development");
    EXPECT_FALSE(cfg.dryRun);
    EXPECT_EQ(cfg.logLevel, Logger::Level::INFO);
    EXPECT_FALSE(cfg.logFile.has_value());
}

TEST(Config, BlankOptionalValuesAreAbsent) {
    auto env = validEnv();
    env["UNLEASH_DEFAULT_PROJECT"] = "   ";
    Config cfg = ConfigLoader(envFrom(env)).Load({});
    EXPECT_FALSE(cfg.defaultProject.has_value());
}

TEST(Config, FlagsFromCommandLine) {
    Config a = ConfigLoader(envFrom(validEnv())).Load({"--dry-run", "--log-level", "debug"});
    EXPECT_TRUE(a.dryRun);
    EXPECT_EQ(a.logLevel, Logger::Level::DEBUG);

    Config b = ConfigLoader(envFrom(validEnv())).Load({"--log-level=warn"});
    EXPECT_FALSE(b.dryRun);
    EXPECT_EQ(b.logLevel, Logger::Level::WARN);
}

TEST(Config, AggregatesAllProblems) {
    try {
        (void)ConfigLoader(envFrom({{"UNLEASH_BASE_URL", "not a url"}})).Load({"--log-level=loud"});
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        const std::string msg = e.what();
        EXPECT_EQ(msg.rfind("Configuration validation failed:", 0), 0u);
        EXPECT_NE(msg.find("  - unleash.baseUrl: UNLEASH_BASE_URL must be a valid URL"), std::string::npos);
        EXPECT_NE(msg.find("  - unleash.pat: UNLEASH_PAT is required"), std::string::npos);
        EXPECT_NE(msg.find("server.logLevel"), std::string::npos);
        EXPECT_EQ(e.issues().size(), 3u);
    }
}

TEST(Config, MissingLogLevelValue) {
    EXPECT_THROW((void)ConfigLoader(envFrom(validEnv())).Load({"--log-level"}), ConfigError);
}

TEST(Config, NormalizeBaseUrl) {
    EXPECT_EQ(NormalizeBaseUrl("http://localhost:4242/").value_or(""), "http://localhost:4242");
    EXPECT_EQ(NormalizeBaseUrl("https://host//a///b//").value_or(""), "https://host/a/b");
    EXPECT_EQ(NormalizeBaseUrl("https://host").value_or(""), "https://host");
    EXPECT_FALSE(NormalizeBaseUrl("ftp://host").has_value());
    EXPECT_FALSE(NormalizeBaseUrl("https:///path").has_value());
    EXPECT_FALSE(NormalizeBaseUrl("host/path").has_value());
}

TEST(DotEnv, ParsesCommentsQuotesAndExport) {
    auto values = ParseDotEnv(
        "# comment\n"
        "UNLEASH_BASE_URL=https://example.com\n"
        "export UNLEASH_PAT=\"user:quoted value\"\n"
        "UNLEASH_DEFAULT_PROJECT='default' \n"
        "APP_LOG_FILE=/tmp/x.log # trailing\n"
        "malformed line\n"
        "=novalue\n");
    EXPECT_EQ(values["UNLEASH_BASE_URL"], "https://example.com");
    EXPECT_EQ(values["UNLEASH_PAT"], "user:quoted value");
    EXPECT_EQ(values["UNLEASH_DEFAULT_PROJECT"], "default");
    EXPECT_EQ(values["APP_LOG_FILE"], "/tmp/x.log");
    EXPECT_EQ(values.size(), 4u);
}
