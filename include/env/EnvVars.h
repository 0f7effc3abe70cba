//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: EnvVars.h
// Purpose: Helpers to read environment variables and KEY=VALUE .env files.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <unordered_map>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// ParseDotEnv
// Purpose: Parses .env text: KEY=VALUE per line, '#' comments, optional "export " prefix, and single
//          or double quoted values. Malformed lines are skipped.
// Args:
//   text: Raw file contents.
// Returns:
//   Map of key to value; later keys override earlier ones.
//==========================================================================================================
inline std::unordered_map<std::string, std::string> ParseDotEnv(const std::string& text) {
    auto trim = [](const std::string& s) {
        const auto b = s.find_first_not_of(" \t\r");
        if (b == std::string::npos) return std::string();
        const auto e = s.find_last_not_of(" \t\r");
        return s.substr(b, e - b + 1);
    };
    std::unordered_map<std::string, std::string> out;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t nl = text.find('\n', pos);
        if (nl == std::string::npos) nl = text.size();
        std::string line = trim(text.substr(pos, nl - pos));
        pos = nl + 1;
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));
        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            const auto hash = value.find(" #");
            if (hash != std::string::npos) value = trim(value.substr(0, hash));
        }
        out[key] = value;
    }
    return out;
}

//==========================================================================================================
// LoadDotEnvFile
// Purpose: Reads and parses a .env file; a missing file yields an empty map.
//==========================================================================================================
inline std::unordered_map<std::string, std::string> LoadDotEnvFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return {};
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return ParseDotEnv(text);
}
