//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sink: level parsing, log file management and line output.
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iostream>

#include "env/EnvVars.h"

namespace {

LogLevel initialLevel() {
    return Logger::levelFromString(GetEnvOrDefault("MCP_LOG_LEVEL", "INFO"));
}

bool colorEnabled() {
    static const bool enabled = GetEnvBoolOrDefault("MCP_LOG_COLOR", true);
    return enabled;
}

const char* labelColor(const char* level) {
    if (std::strncmp(level, "ERROR", 5) == 0 || std::strncmp(level, "FATAL", 5) == 0) {
        return "\033[38;5;88m"; // burgundy
    }
    if (std::strncmp(level, "WARN", 4) == 0) {
        return "\033[33m";
    }
    return "\033[35m";
}

const char* baseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

std::string localTimestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tmBuf{};
    ::localtime_r(&now, &tmBuf);
    char out[32];
    const std::size_t n = std::strftime(out, sizeof(out), "%Y-%m-%d %H:%M:%S", &tmBuf);
    return std::string(out, n);
}

} // namespace

std::atomic<LogLevel> Logger::sLogLevel{initialLevel()};
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

LogLevel Logger::levelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) {
        s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "INFO") return LogLevel::LOG_INFO_LEVEL;
    if (s == "WARN" || s == "WARNING") return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "FATAL" || s == "CRITICAL") return LogLevel::LOG_FATAL_LEVEL;
    return LogLevel::LOG_INFO_LEVEL;
}

bool Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        const int err = errno;
        std::cerr << localTimestamp() << " [ERROR] Failed to open log file " << filePath << ": "
                  << std::strerror(err) << std::endl;
        return false;
    }
    sLogFile << "\n=== Log opened at " << localTimestamp() << " ===\n";
    sLogFile.flush();
    return true;
}

void Logger::write(const char* level, const std::string& msg, const char* file, unsigned int line) {
    const std::string stamp = localTimestamp();
    const std::string plain = fmt::format("{} [{}] {}:{}: {}\n", stamp, level, baseName(file), line, msg);

    std::lock_guard<std::mutex> lock(sLogMutex);
    // stderr only; stdout is never used for protocol data but stays free for --help and --version
    if (colorEnabled()) {
        std::cerr << fmt::format("{} [{}{}\033[0m] {}:{}: {}\n", stamp, labelColor(level), level, baseName(file),
                                 line, msg);
    } else {
        std::cerr << plain;
    }
    std::cerr.flush();
    if (sLogFile.is_open()) {
        sLogFile << plain;
        sLogFile.flush();
    }
}
