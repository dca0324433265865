//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FileToolProvider.hpp
// Purpose: list_files and read_file confined to one root directory
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "mcpgate/ToolRegistry.hpp"

namespace mcpgate::tools {

//==========================================================================================================
// FileToolProvider
// Purpose: Read-only file access below a fixed root.
// Notes:
//   - Requested paths are resolved against the root with std::filesystem::weakly_canonical, so ".." and
//     symlinks are followed before the containment check.
//   - read_file refuses non-regular files and files larger than the effective max size.
//==========================================================================================================
class FileToolProvider : public IToolProvider {
public:
    FileToolProvider(const std::string& root, std::size_t maxFileSize);

    std::vector<Tool> GetToolDefinitions() const override;
    std::optional<ToolHandler> GetHandler(const std::string& name) override;

    ToolResult ListFiles(const JSONValue& args, const ClientSession& session) const;
    ToolResult ReadFile(const JSONValue& args, const ClientSession& session) const;

    // Canonical path for request inside the root; nullopt when it escapes.
    std::optional<std::filesystem::path> ResolveInsideRoot(const std::string& request) const;

    const std::filesystem::path& Root() const { return root; }

private:
    std::filesystem::path root;
    std::size_t maxFileSize;
};

// Human readable size: 512B, 1.5KB, 3.2MB, 1.0GB
std::string FormatSize(std::uintmax_t bytes);

} // namespace mcpgate::tools
