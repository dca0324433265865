//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Level-filtered logging with {}-style format strings, optional log file and colored labels.
//==========================================================================================================
#pragma once

#include <atomic>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <utility>

#include <fmt/format.h>

enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

//==========================================================================================================
// Logger
// Purpose: Process-wide sink shared by every component. Lines go to stderr and, when configured, to a
//          log file. Format: "YYYY-MM-DD HH:MM:SS [LEVEL] file.cpp:123: message".
// Notes:
//   - The level is read without the lock so disabled calls cost one atomic load.
//   - MCP_LOG_LEVEL and MCP_LOG_COLOR are read once on first use.
//==========================================================================================================
class Logger {
public:
    //==========================================================================================================
    // levelFromString
    // Purpose: Convert common level strings to LogLevel (case-insensitive).
    // Args:
    //   lvl: "DEBUG", "INFO", "WARN"/"WARNING", "ERROR" or "FATAL"/"CRITICAL".
    // Returns:
    //   Matching LogLevel; INFO for unrecognized input.
    //==========================================================================================================
    static LogLevel levelFromString(const std::string& lvl);

    static bool enabled(LogLevel level) {
        return static_cast<int>(level) >= static_cast<int>(sLogLevel.load(std::memory_order_relaxed));
    }

    static void setLogLevel(LogLevel level) { sLogLevel.store(level); }
    static void setLogLevelFromString(const std::string& lvl) { setLogLevel(levelFromString(lvl)); }

    // Appends to filePath; returns false (and keeps logging to stderr) when it cannot be opened.
    static bool setLogFile(const std::string& filePath);

    template <typename... Args>
    static void logf(const char* level, const char* fmtStr, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = fmt::vformat(fmtStr, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            buffer = fmt::format("Format error in \"{}\": {}", fmtStr, e.what());
        }
        write(level, buffer, file, line);
    }

    static void write(const char* level, const std::string& msg, const char* file, unsigned int line);

private:
    static std::atomic<LogLevel> sLogLevel;
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

#define LOG_DEBUG(fmt, ...) if (Logger::enabled(LogLevel::LOG_DEBUG_LEVEL)) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::enabled(LogLevel::LOG_INFO_LEVEL))  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::enabled(LogLevel::LOG_WARN_LEVEL))  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::enabled(LogLevel::LOG_ERROR_LEVEL)) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while (0)

#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
