//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely, with typed variants for config loading.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

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
// GetEnvIntOrDefault
// Purpose: Reads an integer environment variable.
// Throws:
//   std::invalid_argument when the variable is set but is not an integer.
//==========================================================================================================
inline long long GetEnvIntOrDefault(const char* name, long long defaultValue) {
    const std::string v = GetEnvOrDefault(name, std::string());
    if (v.empty()) {
        return defaultValue;
    }
    std::size_t used = 0;
    long long out = 0;
    try {
        out = std::stoll(v, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " is not an integer: " + v);
    }
    if (used != v.size()) {
        throw std::invalid_argument(std::string(name) + " is not an integer: " + v);
    }
    return out;
}

// Parses "1/0", "true/false", "yes/no", "on/off" (case-insensitive).
inline bool ParseBoolString(const std::string& raw, bool defaultValue) {
    std::string s;
    for (char c : raw) s.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defaultValue;
}

inline bool GetEnvBoolOrDefault(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, std::string());
    if (v.empty()) {
        return defaultValue;
    }
    return ParseBoolString(v, defaultValue);
}
