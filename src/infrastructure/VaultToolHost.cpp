/**
 * @file VaultToolHost.cpp
 * @brief Implementation of VaultToolHost.
 */

#include "infrastructure/VaultToolHost.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace vaultbreakdown::infrastructure {

namespace {
    std::string ToLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    json PathSchema(const std::string& description) {
        return {{"type", "string"}, {"description", description}};
    }

    // Required string argument, or nullopt when absent or not a string.
    std::optional<std::string> StringArg(const json& args, const char* key) {
        if (!args.is_object() || !args.contains(key) || !args[key].is_string()) return std::nullopt;
        return args[key].get<std::string>();
    }
}

VaultToolHost::VaultToolHost(const std::string& vaultPath)
    : m_root(fs::absolute(fs::path(vaultPath)).lexically_normal()) {}

std::string VaultToolHost::describe() const {
    return "vault tools at " + m_root.string();
}

std::vector<domain::ToolSpec> VaultToolHost::listTools() {
    return {
        {"read_file", "Read a file from the vault.",
         {{"type", "object"},
          {"properties", {{"path", PathSchema("Vault-relative file path")}}},
          {"required", json::array({"path"})}}},
        {"write_file", "Write content to a file in the vault, creating parent folders.",
         {{"type", "object"},
          {"properties", {{"path", PathSchema("Vault-relative file path")},
                          {"content", {{"type", "string"}, {"description", "Full file content"}}}}},
          {"required", json::array({"path", "content"})}}},
        {"create_folder", "Create a folder (and parents) in the vault.",
         {{"type", "object"},
          {"properties", {{"path", PathSchema("Vault-relative folder path")}}},
          {"required", json::array({"path"})}}},
        {"list_files", "List files in a vault folder.",
         {{"type", "object"},
          {"properties", {{"path", PathSchema("Vault-relative folder path; empty for the root")},
                          {"recursive", {{"type", "boolean"}, {"description", "Include subfolders"}}}}},
          {"required", json::array()}}},
        {"search_vault", "Case-insensitive text search over .md and .txt files.",
         {{"type", "object"},
          {"properties", {{"query", {{"type", "string"}, {"description", "Text to find"}}},
                          {"path", PathSchema("Folder to search in; empty for the whole vault")}}},
          {"required", json::array({"query"})}}}
    };
}

domain::ToolResult VaultToolHost::call(const std::string& name, const json& arguments) {
    try {
        if (name == "read_file") {
            auto path = StringArg(arguments, "path");
            if (!path) return domain::ToolResult::Failure("Missing required argument: path");
            auto content = readFile(*path);
            if (!content) return domain::ToolResult::Failure(content.error().message);
            return domain::ToolResult::Success(*content);
        }
        if (name == "write_file") {
            auto path = StringArg(arguments, "path");
            auto content = StringArg(arguments, "content");
            if (!path) return domain::ToolResult::Failure("Missing required argument: path");
            if (!content) return domain::ToolResult::Failure("Missing required argument: content");
            auto status = writeFile(*path, *content);
            if (!status) return domain::ToolResult::Failure(status.error().message);
            return domain::ToolResult::Success("Wrote " + *path);
        }
        if (name == "create_folder") {
            auto path = StringArg(arguments, "path");
            if (!path) return domain::ToolResult::Failure("Missing required argument: path");
            return createFolder(*path);
        }
        if (name == "list_files") {
            std::string path = StringArg(arguments, "path").value_or("");
            bool recursive = arguments.is_object() && arguments.contains("recursive") &&
                             arguments["recursive"].is_boolean() && arguments["recursive"].get<bool>();
            return listFiles(path, recursive);
        }
        if (name == "search_vault") {
            auto query = StringArg(arguments, "query");
            if (!query) return domain::ToolResult::Failure("Missing required argument: query");
            return searchVault(*query, StringArg(arguments, "path").value_or(""));
        }
    } catch (const std::exception& e) {
        std::cerr << "[VaultToolHost] " << name << " failed: " << e.what() << std::endl;
        return domain::ToolResult::Failure(name + " failed: " + e.what());
    }
    return domain::ToolResult::Failure("Tool not found: " + name);
}

domain::Result<std::string> VaultToolHost::readFile(const std::string& relativePath) {
    fs::path full = PathUtils::ResolveInside(m_root, relativePath);
    if (full.empty()) {
        return domain::Result<std::string>::Fail(domain::ErrorKind::Access, "Path outside the vault: " + relativePath);
    }
    std::error_code ec;
    if (!fs::is_regular_file(full, ec)) {
        return domain::Result<std::string>::Fail(domain::ErrorKind::Access, "File not found: " + relativePath);
    }
    std::ifstream file(full, std::ios::binary);
    if (!file.is_open()) {
        return domain::Result<std::string>::Fail(domain::ErrorKind::Access, "Error reading file: " + relativePath);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

domain::Status VaultToolHost::writeFile(const std::string& relativePath, const std::string& content) {
    fs::path full = PathUtils::ResolveInside(m_root, relativePath);
    if (full.empty() || full == m_root) {
        return domain::Status::Fail(domain::ErrorKind::ToolExecution, "Path outside the vault: " + relativePath);
    }
    auto status = AtomicFileWriter::Write(full.string(), content);
    if (!status) {
        return domain::Status::Fail(domain::ErrorKind::ToolExecution, "Error writing file: " + status.error().message);
    }
    return domain::Status::Ok();
}

domain::ToolResult VaultToolHost::createFolder(const std::string& relativePath) {
    fs::path full = PathUtils::ResolveInside(m_root, relativePath);
    if (full.empty()) return domain::ToolResult::Failure("Path outside the vault: " + relativePath);

    std::error_code ec;
    fs::create_directories(full, ec);
    if (ec) return domain::ToolResult::Failure("Error creating folder: " + ec.message());
    return domain::ToolResult::Success("Created folder " + relativePath);
}

domain::ToolResult VaultToolHost::listFiles(const std::string& relativePath, bool recursive) {
    fs::path full = PathUtils::ResolveInside(m_root, relativePath);
    std::error_code ec;
    if (full.empty() || !fs::is_directory(full, ec)) {
        return domain::ToolResult::Failure("Folder not found: " + relativePath);
    }

    json files = json::array();
    std::error_code entryEc;
    if (recursive) {
        for (fs::recursive_directory_iterator it(full, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file(entryEc)) files.push_back(PathUtils::RelativeTo(it->path(), m_root));
        }
    } else {
        for (fs::directory_iterator it(full, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file(entryEc)) files.push_back(PathUtils::RelativeTo(it->path(), m_root));
        }
    }
    if (ec) return domain::ToolResult::Failure("Error listing files: " + ec.message());

    std::vector<std::string> sorted = files.get<std::vector<std::string>>();
    std::sort(sorted.begin(), sorted.end());
    return domain::ToolResult::Success(json{{"files", sorted}}.dump());
}

domain::ToolResult VaultToolHost::searchVault(const std::string& query, const std::string& relativePath) {
    std::string rel = relativePath;
    while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
    fs::path full = PathUtils::ResolveInside(m_root, rel);
    std::error_code ec;
    if (full.empty() || !fs::is_directory(full, ec)) {
        return domain::ToolResult::Failure("Folder not found: " + relativePath);
    }

    const std::string needle = ToLower(query);
    json results = json::array();
    for (fs::recursive_directory_iterator it(full, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (!it->is_regular_file(entryEc)) continue;
        const auto ext = it->path().extension();
        if (ext != ".md" && ext != ".txt") continue;

        std::ifstream file(it->path(), std::ios::binary);
        if (!file.is_open()) continue; // unreadable files are skipped
        std::stringstream buffer;
        buffer << file.rdbuf();
        const std::string content = buffer.str();

        size_t index = ToLower(content).find(needle);
        if (index == std::string::npos) continue;
        size_t start = index > kSnippetRadius ? index - kSnippetRadius : 0;
        size_t snippetEnd = std::min(content.size(), index + query.size() + kSnippetRadius);
        results.push_back({{"path", PathUtils::RelativeTo(it->path(), m_root)},
                           {"snippet", content.substr(start, snippetEnd - start)}});
    }
    if (ec) return domain::ToolResult::Failure("Error searching vault: " + ec.message());
    return domain::ToolResult::Success(json{{"results", results}}.dump());
}

} // namespace vaultbreakdown::infrastructure
