/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace vaultbreakdown::infrastructure {

namespace {
    std::string Env(const char* name) {
        const char* value = std::getenv(name);
        return (value && *value) ? std::string(value) : std::string();
    }
}

domain::Result<application::AppConfig> ConfigLoader::Load(const std::string& settingsPath) {
    application::AppConfig config;

    if (std::filesystem::exists(settingsPath)) {
        try {
            std::ifstream f(settingsPath);
            nlohmann::json j;
            f >> j;

            config.vaultPath = j.value("vault_path", config.vaultPath);
            config.watchSubdir = j.value("watch_subdir", config.watchSubdir);
            config.mcpPath = j.value("mcp_path", config.mcpPath);
            config.nodeExecutable = j.value("node_executable", config.nodeExecutable);
            config.model = j.value("model", config.model);
            config.ollamaHost = j.value("ollama_host", config.ollamaHost);
            config.ollamaPort = j.value("ollama_port", config.ollamaPort);
            config.stateDir = j.value("state_dir", config.stateDir);
            config.plannerPromptPath = j.value("planner_prompt", config.plannerPromptPath);
            config.executorPromptPath = j.value("executor_prompt", config.executorPromptPath);
            config.maxToolRounds = j.value("max_tool_rounds", config.maxToolRounds);
            config.maxChatTurns = j.value("max_chat_turns", config.maxChatTurns);
            config.channelCapacity = j.value("channel_capacity", config.channelCapacity);
            config.verbose = j.value("verbose", config.verbose);
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << settingsPath << ": " << e.what() << std::endl;
            return domain::Result<application::AppConfig>::Fail(
                domain::ErrorKind::Config, "invalid settings file " + settingsPath + ": " + e.what());
        }
    }

    auto envStatus = ApplyEnvironment(config);
    if (!envStatus) return envStatus.error();

    auto finalStatus = Finalize(config);
    if (!finalStatus) return finalStatus.error();

    return config;
}

domain::Result<application::AppConfig> ConfigLoader::LoadDefault() {
    return Load(PathUtils::GetSettingsFile().string());
}

domain::Status ConfigLoader::ApplyEnvironment(application::AppConfig& config) {
    std::string vault = Env("VAULT_PATH");
    if (!vault.empty()) config.vaultPath = vault;

    std::string mcp = Env("MCP_PATH");
    if (!mcp.empty()) config.mcpPath = mcp;

    std::string model = Env("OLLAMA_MODEL");
    if (!model.empty()) config.model = model;

    std::string host = Env("OLLAMA_HOST");
    if (!host.empty()) config.ollamaHost = host;

    std::string port = Env("OLLAMA_PORT");
    if (!port.empty()) {
        try {
            config.ollamaPort = std::stoi(port);
        } catch (const std::exception&) {
            return domain::Status::Fail(domain::ErrorKind::Config, "OLLAMA_PORT is not a number: " + port);
        }
    }

    std::string stateDir = Env("VAULT_BREAKDOWN_STATE_DIR");
    if (!stateDir.empty()) config.stateDir = stateDir;

    return domain::Status::Ok();
}

domain::Status ConfigLoader::Finalize(application::AppConfig& config) {
    if (config.vaultPath.empty()) {
        return domain::Status::Fail(domain::ErrorKind::Config,
                                    "vault path is not set (VAULT_PATH or \"vault_path\" in settings.json)");
    }
    if (config.stateDir.empty()) {
        config.stateDir = PathUtils::GetStateDir().string();
    }
    if (config.maxToolRounds < 1 || config.maxChatTurns < 1 || config.channelCapacity < 1) {
        return domain::Status::Fail(domain::ErrorKind::Config, "limits must be positive");
    }
    if (config.ollamaPort <= 0 || config.ollamaPort > 65535) {
        return domain::Status::Fail(domain::ErrorKind::Config,
                                    "ollama port out of range: " + std::to_string(config.ollamaPort));
    }
    return domain::Status::Ok();
}

} // namespace vaultbreakdown::infrastructure
