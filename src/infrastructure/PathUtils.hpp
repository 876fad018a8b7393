// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace vaultbreakdown::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetStateDir();
    static std::filesystem::path GetSettingsFile();

    /**
     * @brief Resolves a vault-relative path, rejecting anything that escapes the root.
     * @return Empty path when relative is absolute or climbs out of root.
     */
    static std::filesystem::path ResolveInside(const std::filesystem::path& root, const std::string& relative);

    /** @brief generic_string() of path relative to root, or the path itself when unrelated. */
    static std::string RelativeTo(const std::filesystem::path& path, const std::filesystem::path& root);
};

} // namespace vaultbreakdown::infrastructure
