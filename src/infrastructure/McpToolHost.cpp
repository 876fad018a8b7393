/**
 * @file McpToolHost.cpp
 * @brief Implementation of McpToolHost.
 */

#include "infrastructure/McpToolHost.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

using json = nlohmann::json;

namespace vaultbreakdown::infrastructure {

McpToolHost::McpToolHost(std::string executable, std::vector<std::string> args, int timeoutMs, bool verbose)
    : m_executable(std::move(executable)), m_args(std::move(args)), m_timeoutMs(timeoutMs), m_verbose(verbose) {}

McpToolHost::~McpToolHost() {
    stop();
}

bool McpToolHost::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pid > 0;
}

std::string McpToolHost::describe() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::string text = "MCP server " + (m_serverName.empty() ? m_executable : m_serverName);
    text += m_pid > 0 ? " (pid " + std::to_string(m_pid) + ", " + std::to_string(m_tools.size()) + " tools)"
                      : " (not running)";
    return text;
}

domain::Status McpToolHost::spawn() {
    int stdinPipe[2];
    int stdoutPipe[2];

    if (pipe(stdinPipe) < 0) {
        return domain::Status::Fail(domain::ErrorKind::Transport, std::string("pipe() failed: ") + strerror(errno));
    }
    if (pipe(stdoutPipe) < 0) {
        close(stdinPipe[0]);
        close(stdinPipe[1]);
        return domain::Status::Fail(domain::ErrorKind::Transport, std::string("pipe() failed: ") + strerror(errno));
    }

    std::vector<const char*> argv;
    argv.push_back(m_executable.c_str());
    for (const auto& arg : m_args) argv.push_back(arg.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close(stdinPipe[0]);
        close(stdinPipe[1]);
        close(stdoutPipe[0]);
        close(stdoutPipe[1]);
        return domain::Status::Fail(domain::ErrorKind::Transport, std::string("fork() failed: ") + strerror(errno));
    }

    if (pid == 0) {
        // Child process
        dup2(stdinPipe[0], STDIN_FILENO);
        dup2(stdoutPipe[1], STDOUT_FILENO);
        close(stdinPipe[0]);
        close(stdinPipe[1]);
        close(stdoutPipe[0]);
        close(stdoutPipe[1]);

        execvp(m_executable.c_str(), const_cast<char* const*>(argv.data()));
        std::cerr << "[McpToolHost] execvp() failed: " << strerror(errno) << std::endl;
        _exit(127);
    }

    // Parent process
    m_pid = pid;
    close(stdinPipe[0]);
    close(stdoutPipe[1]);
    m_stdinFd = stdinPipe[1];
    m_stdoutFd = stdoutPipe[0];

    int flags = fcntl(m_stdoutFd, F_GETFL, 0);
    fcntl(m_stdoutFd, F_SETFL, flags | O_NONBLOCK);

    std::cout << "[McpToolHost] Started " << m_executable << " with PID " << pid << std::endl;
    return domain::Status::Ok();
}

domain::Status McpToolHost::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_pid > 0) return domain::Status::Ok();

    auto spawned = spawn();
    if (!spawned) return spawned;

    json initParams = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", json::object()},
        {"clientInfo", {{"name", "vault-breakdown"}, {"version", "0.1.0"}}}
    };
    auto init = request("initialize", initParams);
    if (!init) {
        stopLocked();
        return init.error();
    }
    if (init->contains("serverInfo") && (*init)["serverInfo"].is_object()) {
        m_serverName = (*init)["serverInfo"].value("name", "");
    }

    auto notified = sendLine({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    if (!notified) {
        stopLocked();
        return notified;
    }

    auto listed = request("tools/list", json::object());
    if (!listed) {
        stopLocked();
        return listed.error();
    }
    m_tools.clear();
    if (listed->contains("tools") && (*listed)["tools"].is_array()) {
        for (const auto& tool : (*listed)["tools"]) {
            domain::ToolSpec spec;
            spec.name = tool.value("name", "");
            spec.description = tool.value("description", "");
            if (tool.contains("inputSchema") && tool["inputSchema"].is_object()) {
                spec.inputSchema = tool["inputSchema"];
            }
            if (!spec.name.empty()) m_tools.push_back(std::move(spec));
        }
    }
    std::cout << "[McpToolHost] Initialized " << (m_serverName.empty() ? m_executable : m_serverName)
              << " with " << m_tools.size() << " tool(s)." << std::endl;
    return domain::Status::Ok();
}

void McpToolHost::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    stopLocked();
}

void McpToolHost::stopLocked() {
    if (m_stdinFd >= 0) {
        close(m_stdinFd);
        m_stdinFd = -1;
    }
    if (m_stdoutFd >= 0) {
        close(m_stdoutFd);
        m_stdoutFd = -1;
    }

    if (m_pid > 0) {
        kill(m_pid, SIGTERM);

        int status;
        int waitAttempts = 10;
        while (waitAttempts-- > 0) {
            pid_t result = waitpid(m_pid, &status, WNOHANG);
            if (result != 0) break;
            usleep(100000); // 100ms
        }

        // Force kill if still running
        if (waitpid(m_pid, &status, WNOHANG) == 0) {
            kill(m_pid, SIGKILL);
            waitpid(m_pid, &status, 0);
        }
        std::cout << "[McpToolHost] Stopped PID " << m_pid << std::endl;
        m_pid = -1;
    }
    m_readBuffer.clear();
}

domain::Status McpToolHost::sendLine(const json& message) {
    if (m_stdinFd < 0) {
        return domain::Status::Fail(domain::ErrorKind::Transport, "MCP server not running");
    }
    std::string line = message.dump() + "\n";
    if (m_verbose) {
        std::cerr << "[McpToolHost] Sending: " << line;
    }

    size_t offset = 0;
    while (offset < line.size()) {
        ssize_t written = write(m_stdinFd, line.data() + offset, line.size() - offset);
        if (written < 0) {
            if (errno == EINTR) continue;
            return domain::Status::Fail(domain::ErrorKind::Transport, std::string("write() failed: ") + strerror(errno));
        }
        offset += static_cast<size_t>(written);
    }
    return domain::Status::Ok();
}

domain::Result<json> McpToolHost::readResponse(long long id) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_timeoutMs);

    while (true) {
        // Process complete lines already buffered
        size_t pos;
        while ((pos = m_readBuffer.find('\n')) != std::string::npos) {
            std::string line = m_readBuffer.substr(0, pos);
            m_readBuffer.erase(0, pos + 1);
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

            json message = json::parse(line, nullptr, false);
            if (message.is_discarded() || !message.is_object()) {
                if (m_verbose) std::cerr << "[McpToolHost] Ignoring non-JSON output: " << line << std::endl;
                continue;
            }
            if (!message.contains("id") || message.contains("method")) {
                // Notification or server-initiated request
                if (m_verbose) std::cerr << "[McpToolHost] Ignoring message: " << line << std::endl;
                continue;
            }
            if (!message["id"].is_number_integer() || message["id"].get<long long>() != id) continue;

            if (message.contains("error")) {
                const auto& err = message["error"];
                std::string text = err.is_object() ? err.value("message", err.dump()) : err.dump();
                return domain::Result<json>::Fail(domain::ErrorKind::ToolExecution, text);
            }
            return message.value("result", json::object());
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return domain::Result<json>::Fail(domain::ErrorKind::Transport, "timed out waiting for MCP response");
        }

        struct pollfd pfd;
        pfd.fd = m_stdoutFd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int pollResult = poll(&pfd, 1, static_cast<int>(remaining));
        if (pollResult < 0) {
            if (errno == EINTR) continue;
            return domain::Result<json>::Fail(domain::ErrorKind::Transport,
                                              std::string("poll() failed: ") + strerror(errno));
        }
        if (pollResult == 0) continue;

        char chunk[4096];
        ssize_t n = read(m_stdoutFd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return domain::Result<json>::Fail(domain::ErrorKind::Transport,
                                              std::string("read() failed: ") + strerror(errno));
        }
        if (n == 0) {
            return domain::Result<json>::Fail(domain::ErrorKind::Transport, "MCP server closed stdout");
        }
        m_readBuffer.append(chunk, static_cast<size_t>(n));
    }
}

domain::Result<json> McpToolHost::request(const std::string& method, const json& params) {
    const long long id = m_nextId++;
    auto sent = sendLine({{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}});
    if (!sent) return sent.error();
    return readResponse(id);
}

std::vector<domain::ToolSpec> McpToolHost::listTools() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tools;
}

std::string McpToolHost::ResultText(const json& result) {
    std::string text;
    if (result.contains("content") && result["content"].is_array()) {
        for (const auto& item : result["content"]) {
            if (item.value("type", "") == "text" && item.contains("text") && item["text"].is_string()) {
                if (!text.empty()) text += "\n";
                text += item["text"].get<std::string>();
            }
        }
    }
    if (text.empty() && result.contains("structuredContent")) {
        text = result["structuredContent"].dump();
    }
    return text;
}

domain::ToolResult McpToolHost::call(const std::string& name, const json& arguments) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_pid <= 0) {
        return domain::ToolResult::Failure("MCP server not running");
    }

    try {
        auto result = request("tools/call", {{"name", name},
                                             {"arguments", arguments.is_object() ? arguments : json::object()}});
        if (!result) {
            std::cerr << "[McpToolHost] tools/call " << name << " failed: " << result.error().message << std::endl;
            return domain::ToolResult::Failure(result.error().message);
        }
        std::string text = ResultText(*result);
        if (result->value("isError", false)) {
            return domain::ToolResult::Failure(text.empty() ? "tool reported an error" : text);
        }
        return domain::ToolResult::Success(text);
    } catch (const json::exception& e) {
        std::cerr << "[McpToolHost] Malformed response for " << name << ": " << e.what() << std::endl;
        return domain::ToolResult::Failure(std::string("malformed MCP response: ") + e.what());
    }
}

} // namespace vaultbreakdown::infrastructure
