/**
 * @file VaultToolHost.hpp
 * @brief In-process tool host over the vault directory.
 */

#pragma once
#include "domain/Result.hpp"
#include "domain/ToolHost.hpp"
#include <filesystem>
#include <string>

namespace vaultbreakdown::infrastructure {

/**
 * @class VaultToolHost
 * @brief read_file, write_file, create_folder, list_files and search_vault over one root.
 *
 * All paths are vault-relative; absolute paths and paths that climb out of
 * the root are rejected.
 */
class VaultToolHost : public domain::ToolHost {
public:
    static constexpr size_t kSnippetRadius = 50;

    explicit VaultToolHost(const std::string& vaultPath);

    std::vector<domain::ToolSpec> listTools() override;
    domain::ToolResult call(const std::string& name, const nlohmann::json& arguments) override;
    std::string describe() const override;

    /** @brief Atomic write of a vault-relative file, creating parent folders. */
    domain::Status writeFile(const std::string& relativePath, const std::string& content);

    domain::Result<std::string> readFile(const std::string& relativePath);

    const std::filesystem::path& root() const { return m_root; }

private:
    domain::ToolResult createFolder(const std::string& relativePath);
    domain::ToolResult listFiles(const std::string& relativePath, bool recursive);
    domain::ToolResult searchVault(const std::string& query, const std::string& relativePath);

    std::filesystem::path m_root;
};

} // namespace vaultbreakdown::infrastructure
