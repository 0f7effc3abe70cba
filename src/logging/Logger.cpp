//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: Logger.cpp
// Purpose: Logger and sink implementations.
//==========================================================================================================

#include <cctype>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "logging/Logger.h"

namespace flagbridge {

namespace {
std::string timestampNow() {
    auto now = std::chrono::system_clock::now();
    std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm buf{};
    ::localtime_r(&nowTime, &buf);
    std::ostringstream oss;
    oss << std::put_time(&buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

const char* baseName(const char* path) {
    const char* last = path;
    for (const char* p = path; p && *p; ++p) {
        if (*p == '/' || *p == '\\') {
            last = p + 1;
        }
    }
    return last;
}
} // namespace

//////////////////////////////////////////// Sinks ////////////////////////////////////////////

StderrLogSink::StderrLogSink(bool colorEnabled) : colorEnabled(colorEnabled) {}

void StderrLogSink::Write(const char* level, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex);
    if (colorEnabled) {
        const bool isError = std::string(level) == "ERROR";
        const char* labelColor = isError ? "\033[38;5;88m" /* burgundy */ : "\033[35m" /* purple */;
        std::cerr << "[" << labelColor << level << "\033[0m] " << line << std::endl;
    } else {
        std::cerr << "[" << level << "] " << line << std::endl;
    }
}

FileLogSink::FileLogSink(const std::string& filePath) {
    file.open(filePath, std::ios::out | std::ios::app);
    if (file.is_open()) {
        file << "\n=== Log opened at " << timestampNow() << " ===\n";
        file.flush();
    }
}

bool FileLogSink::IsOpen() const {
    return file.is_open();
}

void FileLogSink::Write(const char* level, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!file.is_open()) {
        return;
    }
    file << timestampNow() << " [" << level << "] " << line << '\n';
    file.flush();
}

//////////////////////////////////////////// Logger ////////////////////////////////////////////

Logger::Logger(Level threshold, std::shared_ptr<ILogSink> sink)
    : minLevel(threshold), sink(sink ? std::move(sink) : std::make_shared<NullLogSink>()) {}

std::optional<Logger::Level> Logger::levelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) {
        s.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    }
    if (s == "debug") return Level::DEBUG;
    if (s == "info") return Level::INFO;
    if (s == "warn" || s == "warning") return Level::WARN;
    if (s == "error") return Level::ERROR;
    return std::nullopt;
}

const char* Logger::levelName(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::WARN: return "WARN";
        case Level::ERROR: return "ERROR";
    }
    return "INFO";
}

void Logger::log(Level level, const std::string& msg, const char* file, unsigned int line) {
    if (!isEnabled(level)) {
        return;
    }
    std::ostringstream oss;
    oss << baseName(file) << ":" << line << ": " << msg;
    sink->Write(levelName(level), oss.str());
}

std::shared_ptr<Logger> MakeLogger(Logger::Level threshold,
                                   const std::optional<std::string>& logFile,
                                   bool colorEnabled) {
    if (logFile.has_value() && !logFile->empty()) {
        auto fileSink = std::make_shared<FileLogSink>(logFile.value());
        if (fileSink->IsOpen()) {
            return std::make_shared<Logger>(threshold, fileSink);
        }
        std::cerr << "[ERROR] Failed to open log file: " << logFile.value() << " (errno=" << errno
                  << "); logging to stderr" << std::endl;
    }
    return std::make_shared<Logger>(threshold, std::make_shared<StderrLogSink>(colorEnabled));
}

std::shared_ptr<Logger> MakeNullLogger() {
    return std::make_shared<Logger>(Logger::Level::ERROR, std::make_shared<NullLogSink>());
}

} // namespace flagbridge
