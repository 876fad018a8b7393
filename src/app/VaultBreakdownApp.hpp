/**
 * @file VaultBreakdownApp.hpp
 * @brief Main application class for VaultBreakdown.
 */

#pragma once

#include "application/AppServices.hpp"
#include <memory>
#include <string>
#include <vector>

namespace vaultbreakdown::infrastructure {
class McpToolHost;
}

namespace vaultbreakdown::app {

/**
 * @class VaultBreakdownApp
 * @brief Composition root and sub-command dispatch (watch, scan, run, chat).
 */
class VaultBreakdownApp {
public:
    VaultBreakdownApp();
    ~VaultBreakdownApp();

    /**
     * @brief Parses the command line and runs the selected sub-command.
     * @return Exit code (0 for success).
     */
    int Run(int argc, char** argv);

    static void PrintUsage(const char* program);

private:
    /**
     * @brief Loads the configuration and wires the services.
     * @return True if initialization succeeded.
     */
    bool Init();
    void Shutdown();

    int RunWatch();
    int RunScan();
    int RunSingle(const std::string& path);
    int RunChat();

    application::AppServices m_services;
    std::shared_ptr<infrastructure::McpToolHost> m_mcp; ///< Set when an external tool host is configured.
};

} // namespace vaultbreakdown::app
