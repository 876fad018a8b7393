/**
 * @file McpToolHost.hpp
 * @brief Tool host backed by an MCP server subprocess (JSON-RPC 2.0 over stdio).
 */

#pragma once
#include "domain/Result.hpp"
#include "domain/ToolHost.hpp"
#include <mutex>
#include <string>
#include <sys/types.h>
#include <vector>

namespace vaultbreakdown::infrastructure {

/**
 * @class McpToolHost
 * @brief Launches the server, performs the initialize handshake and forwards tools/call.
 *
 * Messages are newline-delimited JSON on the child's stdin/stdout. The child's
 * stderr is inherited.
 */
class McpToolHost : public domain::ToolHost {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";

    /**
     * @param executable Program to run (looked up in PATH).
     * @param args Arguments after the program name.
     * @param timeoutMs Per-request response timeout.
     */
    McpToolHost(std::string executable, std::vector<std::string> args,
                int timeoutMs = 120000, bool verbose = false);
    ~McpToolHost() override;

    McpToolHost(const McpToolHost&) = delete;
    McpToolHost& operator=(const McpToolHost&) = delete;

    /** @brief Spawns the server, runs initialize and caches tools/list. */
    domain::Status start();

    /** @brief Closes the pipes and terminates the child (SIGTERM, then SIGKILL). */
    void stop();

    bool isRunning() const;

    std::vector<domain::ToolSpec> listTools() override;
    domain::ToolResult call(const std::string& name, const nlohmann::json& arguments) override;
    std::string describe() const override;

    /** @brief Joins the text items of an MCP tools/call result. */
    static std::string ResultText(const nlohmann::json& result);

private:
    domain::Status spawn();
    domain::Result<nlohmann::json> request(const std::string& method, const nlohmann::json& params);
    domain::Status sendLine(const nlohmann::json& message);
    domain::Result<nlohmann::json> readResponse(long long id);
    void stopLocked();

    std::string m_executable;
    std::vector<std::string> m_args;
    int m_timeoutMs;
    bool m_verbose;

    pid_t m_pid = -1;
    int m_stdinFd = -1;
    int m_stdoutFd = -1;
    std::string m_readBuffer;
    long long m_nextId = 1;
    std::string m_serverName;
    std::vector<domain::ToolSpec> m_tools;
    mutable std::mutex m_mutex;
};

} // namespace vaultbreakdown::infrastructure
