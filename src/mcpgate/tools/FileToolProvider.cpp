//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgate/tools/FileToolProvider.cpp
// Purpose: Confined directory listing and file reading
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iterator>
#include <system_error>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpgate/MetricsCollector.hpp"
#include "mcpgate/tools/FileToolProvider.hpp"

namespace mcpgate::tools {

namespace fs = std::filesystem;

namespace {

const char* kAccessDenied = "Access denied: path outside allowed directory";

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string permissionString(fs::perms p) {
    auto bit = [p](fs::perms mask, char c) { return (p & mask) != fs::perms::none ? c : '-'; };
    std::string out;
    out += bit(fs::perms::owner_read, 'r');
    out += bit(fs::perms::owner_write, 'w');
    out += bit(fs::perms::owner_exec, 'x');
    out += bit(fs::perms::group_read, 'r');
    out += bit(fs::perms::group_write, 'w');
    out += bit(fs::perms::group_exec, 'x');
    out += bit(fs::perms::others_read, 'r');
    out += bit(fs::perms::others_write, 'w');
    out += bit(fs::perms::others_exec, 'x');
    return out;
}

std::string modifiedTime(const fs::path& p) {
    std::error_code ec;
    auto ftime = fs::last_write_time(p, ec);
    if (ec) {
        return "unknown";
    }
    auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
    return FormatIso8601(sys);
}

struct Entry {
    std::string name;
    std::string type;
    std::optional<std::uintmax_t> size;
    std::string permissions;
    std::string modified;
    std::string error;
};

Entry describe(const fs::directory_entry& de) {
    Entry e;
    e.name = de.path().filename().string();
    std::error_code ec;
    auto st = de.status(ec);
    if (ec) {
        e.type = "error";
        e.error = ec.message();
        return e;
    }
    if (de.is_symlink(ec)) {
        e.type = fs::is_directory(st) ? "directory" : "symlink";
    } else if (fs::is_directory(st)) {
        e.type = "directory";
    } else if (fs::is_regular_file(st)) {
        e.type = "file";
        auto sz = de.file_size(ec);
        if (!ec) {
            e.size = sz;
        }
    } else {
        e.type = "other";
    }
    e.permissions = permissionString(st.permissions());
    e.modified = modifiedTime(de.path());
    return e;
}

} // namespace

std::string FormatSize(std::uintmax_t bytes) {
    const double b = static_cast<double>(bytes);
    if (bytes < 1024) {
        return fmt::format("{}B", bytes);
    }
    if (bytes < 1024ull * 1024) {
        return fmt::format("{:.1f}KB", b / 1024.0);
    }
    if (bytes < 1024ull * 1024 * 1024) {
        return fmt::format("{:.1f}MB", b / (1024.0 * 1024.0));
    }
    return fmt::format("{:.1f}GB", b / (1024.0 * 1024.0 * 1024.0));
}

FileToolProvider::FileToolProvider(const std::string& rootDir, std::size_t maxSize) : maxFileSize(maxSize) {
    std::error_code ec;
    root = fs::weakly_canonical(fs::absolute(rootDir.empty() ? std::string(".") : rootDir), ec);
    if (ec) {
        throw fs::filesystem_error("Cannot resolve file root", rootDir, ec);
    }
    if (!fs::is_directory(root, ec)) {
        throw fs::filesystem_error("File root is not a directory", root,
                                   std::make_error_code(std::errc::not_a_directory));
    }
    LOG_INFO("File tools rooted at {} (max file size {} bytes)", root.string(), maxFileSize);
}

std::vector<Tool> FileToolProvider::GetToolDefinitions() const {
    return {
        Tool("list_files", "List files in a directory with type, size and permissions",
             MakeObjectSchema({{"path", "string", "Directory relative to the file root (default '.')"},
                               {"include_hidden", "boolean", "Include dot files"}})),
        Tool("read_file", "Read the contents of a text file",
             MakeObjectSchema({{"path", "string", "File path relative to the file root"},
                               {"max_size", "integer", "Maximum size in bytes to read"}},
                              {"path"})),
    };
}

std::optional<ToolHandler> FileToolProvider::GetHandler(const std::string& name) {
    if (name == "list_files") {
        return ToolHandler([this](const JSONValue& a, const ClientSession& s) { return ListFiles(a, s); });
    }
    if (name == "read_file") {
        return ToolHandler([this](const JSONValue& a, const ClientSession& s) { return ReadFile(a, s); });
    }
    return std::nullopt;
}

std::optional<fs::path> FileToolProvider::ResolveInsideRoot(const std::string& request) const {
    fs::path requested(request.empty() ? std::string(".") : request);
    fs::path candidate = requested.is_absolute() ? requested : root / requested;
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(candidate, ec);
    if (ec) {
        return std::nullopt;
    }
    const fs::path rel = resolved.lexically_relative(root);
    if (rel.empty() || *rel.begin() == "..") {
        return std::nullopt;
    }
    return resolved;
}

ToolResult FileToolProvider::ListFiles(const JSONValue& args, const ClientSession& session) const {
    const std::string path = GetStringMember(args, "path").value_or(".");
    const bool includeHidden = GetBoolMember(args, "include_hidden").value_or(false);

    auto dir = ResolveInsideRoot(path);
    if (!dir.has_value()) {
        LOG_WARN("list_files outside root requested by {}: {}", session.ipAddress, path);
        return MakeTextResult(kAccessDenied, true);
    }
    std::error_code ec;
    if (!fs::exists(*dir, ec)) {
        return MakeTextResult("Error: path not found: " + path, true);
    }
    if (!fs::is_directory(*dir, ec)) {
        return MakeTextResult("Error: " + path + " is not a directory", true);
    }

    std::vector<Entry> entries;
    fs::directory_iterator it(*dir, ec);
    if (ec) {
        return MakeTextResult("Error: cannot read directory " + path + ": " + ec.message(), true);
    }
    for (const auto& de : it) {
        const std::string name = de.path().filename().string();
        if (!includeHidden && !name.empty() && name.front() == '.') {
            continue;
        }
        entries.push_back(describe(de));
    }
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        const bool ad = a.type == "directory";
        const bool bd = b.type == "directory";
        if (ad != bd) {
            return ad;
        }
        return lower(a.name) < lower(b.name);
    });

    std::string text = fmt::format("Directory Listing: {}\n\nTotal items: {}", path, entries.size());
    if (entries.empty()) {
        text += "\n\nDirectory is empty";
        return MakeTextResult(text);
    }
    text += "\n\n";
    for (const auto& e : entries) {
        if (!e.error.empty()) {
            text += fmt::format("{}: {}\n", e.name, e.error);
            continue;
        }
        const bool hidden = !e.name.empty() && e.name.front() == '.';
        text += fmt::format("{}{}\n   Type: {}\n", e.name, hidden ? " (hidden)" : "", e.type);
        if (e.size.has_value()) {
            text += fmt::format("   Size: {}\n", FormatSize(e.size.value()));
        }
        text += fmt::format("   Permissions: {}\n   Modified: {}\n\n", e.permissions, e.modified);
    }
    return MakeTextResult(text);
}

ToolResult FileToolProvider::ReadFile(const JSONValue& args, const ClientSession& session) const {
    auto path = GetStringMember(args, "path");
    if (!path.has_value() || path->empty()) {
        return MakeTextResult("Error: path is required", true);
    }
    std::size_t limit = maxFileSize;
    if (auto requested = GetIntMember(args, "max_size"); requested.has_value() && requested.value() > 0) {
        limit = std::min<std::size_t>(limit, static_cast<std::size_t>(requested.value()));
    }

    auto file = ResolveInsideRoot(path.value());
    if (!file.has_value()) {
        LOG_WARN("read_file outside root requested by {}: {}", session.ipAddress, path.value());
        return MakeTextResult(kAccessDenied, true);
    }
    std::error_code ec;
    if (!fs::exists(*file, ec)) {
        return MakeTextResult("Error: file not found: " + path.value(), true);
    }
    if (!fs::is_regular_file(*file, ec)) {
        return MakeTextResult("Error: " + path.value() + " is not a file", true);
    }
    const std::uintmax_t size = fs::file_size(*file, ec);
    if (ec) {
        return MakeTextResult("Error: cannot access file size: " + ec.message(), true);
    }
    if (size > limit) {
        return MakeTextResult(fmt::format("Error: File size ({} bytes) exceeds maximum allowed size ({} bytes)",
                                          size, limit), true);
    }

    std::ifstream in(*file, std::ios::binary);
    if (!in) {
        return MakeTextResult("Error: permission denied reading " + path.value(), true);
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return MakeTextResult("Error reading file: " + path.value(), true);
    }

    const auto perms = fs::status(*file, ec).permissions();
    const std::string rule(50, '-');
    return MakeTextResult(fmt::format(
        "File Contents: {}\n\nFile Information:\n- Size: {} bytes\n- Permissions: {}\n- Modified: {}\n\n"
        "Content:\n{}\n{}\n{}",
        path.value(), size, permissionString(perms), modifiedTime(*file), rule, content, rule));
}

} // namespace mcpgate::tools
