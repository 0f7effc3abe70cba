//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: Config.h
// Purpose: Immutable runtime configuration and its loader (environment, .env file, command line)
//==========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "logging/Logger.h"

namespace flagbridge {

//==========================================================================================================
// Config
// Purpose: Validated configuration. Built once at startup by ConfigLoader; read-only afterwards.
// Fields:
//   remoteBaseUrl: Unleash instance URL, normalized (no duplicate slashes in path, no trailing slash).
//   accessToken: Personal access token forwarded as the Authorization header.
//   defaultProject/defaultEnvironment: Fallbacks when a tool call omits them.
//   dryRun: Mutations are simulated and not sent.
//   logLevel/logFile: Logger threshold and optional append-only log file.
//==========================================================================================================
struct Config {
    std::string remoteBaseUrl;
    std::string accessToken;
    std::optional<std::string> defaultProject;
    std::optional<std::string> defaultEnvironment;
    bool dryRun{false};
    Logger::Level logLevel{Logger::Level::INFO};
    std::optional<std::string> logFile;
    bool logColor{false};
};

// Aggregated validation failure:
//   "Configuration validation failed:\n  - <path>: <message>\n  - ..."
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(std::vector<std::string> issues);
    const std::vector<std::string>& issues() const { return problems; }

private:
    std::vector<std::string> problems;
};

//==========================================================================================================
// NormalizeBaseUrl
// Purpose: Collapses duplicate slashes in the path component and strips trailing slashes.
// Returns:
//   Normalized URL, or std::nullopt when the value is not an absolute http(s) URL with a host.
//==========================================================================================================
std::optional<std::string> NormalizeBaseUrl(const std::string& url);

//==========================================================================================================
// ConfigLoader
// Purpose: Builds a Config from an environment lookup and argv.
// Notes:
//   - Environment keys: UNLEASH_BASE_URL, UNLEASH_PAT, UNLEASH_DEFAULT_PROJECT,
//     UNLEASH_DEFAULT_ENVIRONMENT, APP_LOG_FILE, FLAGBRIDGE_LOG_COLOR.
//   - Flags: --dry-run, --log-level <level> | --log-level=<level>.
//   - All problems are collected and reported together via ConfigError.
//==========================================================================================================
class ConfigLoader {
public:
    // Returns the variable value, or std::nullopt when unset.
    using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

    explicit ConfigLoader(EnvLookup env);

    // Lookup over the process environment, falling back to values read from a .env file.
    static EnvLookup ProcessEnvironment(const std::string& dotEnvPath = ".env");

    Config Load(const std::vector<std::string>& args) const;

private:
    EnvLookup env;
};

} // namespace flagbridge
