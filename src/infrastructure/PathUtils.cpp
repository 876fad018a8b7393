#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace vaultbreakdown::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetStateDir() {
    return GetDataHome() / "VaultBreakdown" / "state";
}

fs::path PathUtils::GetSettingsFile() {
    return GetConfigHome() / "VaultBreakdown" / "settings.json";
}

fs::path PathUtils::ResolveInside(const fs::path& root, const std::string& relative) {
    fs::path rel(relative);
    if (rel.is_absolute()) return {};

    fs::path base = root.lexically_normal();
    fs::path candidate = (base / rel).lexically_normal();

    // candidate must start with every component of base
    auto b = base.begin();
    auto c = candidate.begin();
    for (; b != base.end(); ++b, ++c) {
        if (b->empty()) continue; // trailing separator
        if (c == candidate.end() || *b != *c) return {};
    }
    return candidate;
}

std::string PathUtils::RelativeTo(const fs::path& path, const fs::path& root) {
    fs::path rel = path.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty() || *rel.begin() == "..") return path.generic_string();
    return rel.generic_string();
}

} // namespace vaultbreakdown::infrastructure
