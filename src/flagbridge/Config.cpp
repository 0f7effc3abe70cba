//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: Config.cpp
// Purpose: Configuration loading and validation
//==========================================================================================================

#include <cstdlib>
#include <memory>
#include <sstream>
#include <unordered_map>

#include "env/EnvVars.h"
#include "flagbridge/Config.h"

namespace flagbridge {

namespace {
std::string joinIssues(const std::vector<std::string>& issues) {
    std::ostringstream oss;
    oss << "Configuration validation failed:";
    for (const auto& issue : issues) {
        oss << "\n  - " << issue;
    }
    return oss.str();
}

std::optional<std::string> nonEmpty(const std::optional<std::string>& v) {
    if (!v.has_value()) return std::nullopt;
    const auto b = v->find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::nullopt;
    const auto e = v->find_last_not_of(" \t\r\n");
    return v->substr(b, e - b + 1);
}

bool isTruthy(const std::string& v) {
    return v == "1" || v == "true" || v == "TRUE" || v == "yes";
}
} // namespace

ConfigError::ConfigError(std::vector<std::string> issues)
    : std::runtime_error(joinIssues(issues)), problems(std::move(issues)) {}

std::optional<std::string> NormalizeBaseUrl(const std::string& url) {
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }
    const std::string scheme = url.substr(0, schemeEnd);
    if (scheme != "http" && scheme != "https") {
        return std::nullopt;
    }
    const auto hostStart = schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);
    const std::string host = url.substr(hostStart, pathStart == std::string::npos ? std::string::npos : pathStart - hostStart);
    if (host.empty() || host.find_first_of(" \t?#") != std::string::npos) {
        return std::nullopt;
    }
    std::string path;
    if (pathStart != std::string::npos) {
        for (std::size_t k = pathStart; k < url.size(); ++k) {
            if (url[k] == '/' && !path.empty() && path.back() == '/') continue;
            path.push_back(url[k]);
        }
        while (!path.empty() && path.back() == '/') path.pop_back();
    }
    return scheme + "://" + host + path;
}

ConfigLoader::ConfigLoader(EnvLookup env) : env(std::move(env)) {}

ConfigLoader::EnvLookup ConfigLoader::ProcessEnvironment(const std::string& dotEnvPath) {
    auto fileValues = std::make_shared<const std::unordered_map<std::string, std::string>>(LoadDotEnvFile(dotEnvPath));
    return [fileValues](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (v) return std::string(v);
        auto it = fileValues->find(name);
        if (it != fileValues->end()) return it->second;
        return std::nullopt;
    };
}

Config ConfigLoader::Load(const std::vector<std::string>& args) const {
    std::vector<std::string> issues;
    Config cfg;

    auto baseUrl = nonEmpty(env("UNLEASH_BASE_URL"));
    if (!baseUrl.has_value()) {
        issues.emplace_back("unleash.baseUrl: UNLEASH_BASE_URL is required");
    } else {
        auto normalized = NormalizeBaseUrl(baseUrl.value());
        if (!normalized.has_value()) {
            issues.emplace_back("unleash.baseUrl: UNLEASH_BASE_URL must be a valid URL");
        } else {
            cfg.remoteBaseUrl = normalized.value();
        }
    }

    auto pat = nonEmpty(env("UNLEASH_PAT"));
    if (!pat.has_value()) {
        issues.emplace_back("unleash.pat: UNLEASH_PAT is required");
    } else {
        cfg.accessToken = pat.value();
    }

    cfg.defaultProject = nonEmpty(env("UNLEASH_DEFAULT_PROJECT"));
    cfg.defaultEnvironment = nonEmpty(env("UNLEASH_DEFAULT_ENVIRONMENT"));
    cfg.logFile = nonEmpty(env("APP_LOG_FILE"));
    auto color = env("FLAGBRIDGE_LOG_COLOR");
    cfg.logColor = color.has_value() && isTruthy(color.value());

    std::optional<std::string> levelArg;
    for (std::size_t k = 0; k < args.size(); ++k) {
        const std::string& a = args[k];
        if (a == "--dry-run") {
            cfg.dryRun = true;
        } else if (a == "--log-level") {
            if (k + 1 < args.size()) {
                levelArg = args[++k];
            } else {
                issues.emplace_back("server.logLevel: --log-level requires a value");
            }
        } else if (a.rfind("--log-level=", 0) == 0) {
            levelArg = a.substr(12);
        }
    }
    if (levelArg.has_value()) {
        auto lvl = Logger::levelFromString(levelArg.value());
        if (!lvl.has_value()) {
            issues.emplace_back("server.logLevel: expected one of debug, info, warn, error (got \"" + levelArg.value() + "\")");
        } else {
            cfg.logLevel = lvl.value();
        }
    }

    if (!issues.empty()) {
        throw ConfigError(std::move(issues));
    }
    return cfg;
}

} // namespace flagbridge
