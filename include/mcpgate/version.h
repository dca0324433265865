//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for mcpgate (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcpgate {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

//==========================================================================================================
// getVersion
// Purpose: Returns the server semantic version components.
//==========================================================================================================
VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string formatted as "MAJOR.MINOR.PATCH".
//==========================================================================================================
std::string getVersionString();

} // namespace mcpgate
