/**
 * @file AppConfig.hpp
 * @brief Runtime configuration passed by value into the services.
 */

#pragma once
#include <cstddef>
#include <string>

namespace vaultbreakdown::application {

/**
 * @struct AppConfig
 * @brief Everything the pipeline needs to know about its environment.
 */
struct AppConfig {
    std::string vaultPath;                 ///< Root of the vault (required).
    std::string watchSubdir = "Clippings"; ///< Watched directory, relative to vaultPath.
    std::string mcpPath;                   ///< Tool-host script; empty means in-process vault tools.
    std::string nodeExecutable = "node";   ///< Interpreter used to launch mcpPath.
    std::string model;                     ///< Empty means auto-detect from the server.
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string stateDir;                  ///< Holds last_run.txt and processed_files.json.
    std::string plannerPromptPath;         ///< Optional planner prompt override.
    std::string executorPromptPath;        ///< Optional executor prompt override.
    int maxToolRounds = 10;                ///< Consecutive tool-use rounds per turn.
    int maxChatTurns = 50;                 ///< Turns per interactive session.
    size_t channelCapacity = 64;           ///< Watch event queue bound.
    bool verbose = false;                  ///< Debug lines (tool traces).

    std::string watchDir() const {
        if (vaultPath.empty()) return watchSubdir;
        if (vaultPath.back() == '/') return vaultPath + watchSubdir;
        return vaultPath + "/" + watchSubdir;
    }
};

} // namespace vaultbreakdown::application
