/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the application configuration (settings.json + environment).
 *
 * Provides a unified way to build an AppConfig without scattering JSON parsing
 * and getenv calls throughout the codebase.
 */

#pragma once

#include <string>
#include "application/AppConfig.hpp"
#include "domain/Result.hpp"

namespace vaultbreakdown::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Loads settings.json (if present), then applies environment overrides.
     * @param settingsPath Path to settings.json; a missing file is not an error.
     * @return The config, or a Config error when the file is malformed or
     *         the vault path is missing.
     */
    static domain::Result<application::AppConfig> Load(const std::string& settingsPath);

    /** @brief Load() from the default location in the config home. */
    static domain::Result<application::AppConfig> LoadDefault();

    /**
     * @brief Applies VAULT_PATH, MCP_PATH, OLLAMA_MODEL, OLLAMA_HOST, OLLAMA_PORT
     *        and VAULT_BREAKDOWN_STATE_DIR to config.
     */
    static domain::Status ApplyEnvironment(application::AppConfig& config);

    /** @brief Checks required fields and fills derived defaults (state dir). */
    static domain::Status Finalize(application::AppConfig& config);
};

} // namespace vaultbreakdown::infrastructure
