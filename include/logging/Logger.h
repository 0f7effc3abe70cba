//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: Logger.h
// Purpose: Level-filtered logger instance writing to exactly one sink (append-only file or stderr).
//==========================================================================================================
#pragma once

#include <format>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace flagbridge {

//==========================================================================================================
// ILogSink
// Purpose: Destination for fully formatted log lines. A Logger owns exactly one sink, chosen at
//          construction. Implementations must never write to stdout (reserved for protocol frames).
//==========================================================================================================
class ILogSink {
public:
    virtual ~ILogSink() = default;

    //==========================================================================================================
    // Writes a single formatted line (without trailing newline).
    // Args:
    //   level: Level label ("DEBUG", "INFO", "WARN", "ERROR").
    //   line: Message already prefixed with file:line.
    //==========================================================================================================
    virtual void Write(const char* level, const std::string& line) = 0;
};

// Writes to stderr; optional ANSI colouring of the level label.
class StderrLogSink : public ILogSink {
public:
    explicit StderrLogSink(bool colorEnabled = false);
    void Write(const char* level, const std::string& line) override;

private:
    bool colorEnabled;
    std::mutex mutex;
};

// Append-only file sink. Writes an "=== Log opened at ... ===" banner on open.
class FileLogSink : public ILogSink {
public:
    explicit FileLogSink(const std::string& filePath);
    bool IsOpen() const;
    void Write(const char* level, const std::string& line) override;

private:
    std::ofstream file;
    std::mutex mutex;
};

// Discards everything. Used by tests and by transports that were given no logger.
class NullLogSink : public ILogSink {
public:
    void Write(const char*, const std::string&) override {}
};

class Logger {
public:
    enum class Level {
        DEBUG = 0,
        INFO  = 1,
        WARN  = 2,
        ERROR = 3
    };

    Logger(Level threshold, std::shared_ptr<ILogSink> sink);

    // Parses debug|info|warn|warning|error (case-insensitive); std::nullopt when unrecognized.
    static std::optional<Level> levelFromString(const std::string& lvl);
    static const char* levelName(Level level);

    Level threshold() const { return minLevel; }
    bool isEnabled(Level level) const { return static_cast<int>(level) >= static_cast<int>(minLevel); }

    // Variadic logging using C++20 std::vformat with runtime format strings
    template <typename... Args>
    void logf(Level level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::string buffer;
        try {
            buffer = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            buffer = std::format("Format error: {}", e.what());
        }
        log(level, buffer, file, line);
    }

    void log(Level level, const std::string& msg, const char* file, unsigned int line);

private:
    Level minLevel;
    std::shared_ptr<ILogSink> sink;
};

//==========================================================================================================
// MakeLogger
// Purpose: Builds the process logger. Uses a FileLogSink when logFile is set and can be opened,
//          otherwise a StderrLogSink. A file that cannot be opened is reported once on stderr.
// Args:
//   threshold: Minimum level written.
//   logFile: Optional append-only log file path.
//   colorEnabled: ANSI colour for the stderr sink label.
// Returns:
//   shared_ptr<Logger> ready to be threaded through the execution context.
//==========================================================================================================
std::shared_ptr<Logger> MakeLogger(Logger::Level threshold,
                                   const std::optional<std::string>& logFile,
                                   bool colorEnabled = false);

// Logger that drops every line.
std::shared_ptr<Logger> MakeNullLogger();

} // namespace flagbridge

// Logging macros with level filtering; the first argument is a Logger&.
#define FLAGBRIDGE_LOG_DEBUG(logger, fmt, ...) (logger).logf(::flagbridge::Logger::Level::DEBUG, fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define FLAGBRIDGE_LOG_INFO(logger, fmt, ...)  (logger).logf(::flagbridge::Logger::Level::INFO, fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define FLAGBRIDGE_LOG_WARN(logger, fmt, ...)  (logger).logf(::flagbridge::Logger::Level::WARN, fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define FLAGBRIDGE_LOG_ERROR(logger, fmt, ...) (logger).logf(::flagbridge::Logger::Level::ERROR, fmt, __FILE__, __LINE__, ##__VA_ARGS__)
