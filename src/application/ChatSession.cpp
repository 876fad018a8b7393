/**
 * @file ChatSession.cpp
 * @brief Implementation of ChatSession.
 */

#include "application/ChatSession.hpp"
#include <iostream>

namespace vaultbreakdown::application {

namespace {
std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}
} // namespace

ChatSession::ChatSession(AppConfig config, std::shared_ptr<AgentRunner> runner, AgentRole executor,
                         std::shared_ptr<domain::ToolHost> tools)
    : m_config(std::move(config)),
      m_runner(std::move(runner)),
      m_executor(std::move(executor)),
      m_tools(std::move(tools)) {
    m_history.push_back(ChatMessage::System(m_executor.systemPrompt));
}

void ChatSession::PrintHelp(std::ostream& out) {
    out << "Commands:\n"
        << "  /help    Show this help\n"
        << "  /status  Show vault, tool host and turn count\n"
        << "  /quit    End the session\n"
        << "Anything else is sent to the assistant." << std::endl;
}

void ChatSession::printStatus(std::ostream& out) const {
    out << "Vault: " << m_config.vaultPath << "\n"
        << "Tools: " << (m_tools ? m_tools->describe() : std::string("none")) << "\n"
        << "Turns: " << m_turns << "/" << m_config.maxChatTurns << std::endl;
}

domain::Result<std::string> ChatSession::send(const std::string& line) {
    if (m_turns >= m_config.maxChatTurns) {
        return domain::Result<std::string>::Fail(domain::ErrorKind::LimitReached, "limit reached");
    }
    ++m_turns;

    const size_t mark = m_history.size();
    m_history.push_back(ChatMessage::User(line));
    auto reply = m_runner->runTurn(m_executor, m_history, CancellationToken());
    if (!reply) {
        m_history.resize(mark);
        std::cerr << "[ChatSession] Turn " << m_turns << " failed: " << reply.error().describe() << std::endl;
    }
    return reply;
}

domain::Status ChatSession::run(std::istream& in, std::ostream& out) {
    out << "Vault chat. Type /help for commands." << std::endl;
    std::string line;
    while (true) {
        out << "> " << std::flush;
        if (!std::getline(in, line)) break;
        const std::string input = Trim(line);
        if (input.empty()) continue;

        if (input == "/quit") {
            break;
        }
        if (input == "/help") {
            PrintHelp(out);
            continue;
        }
        if (input == "/status") {
            printStatus(out);
            continue;
        }

        if (m_turns >= m_config.maxChatTurns) {
            out << "limit reached" << std::endl;
            return domain::Status::Fail(domain::ErrorKind::LimitReached,
                                        "chat turn limit of " + std::to_string(m_config.maxChatTurns) + " reached");
        }

        auto reply = send(input);
        if (reply) {
            out << *reply << std::endl;
        } else {
            out << "Error: " << reply.error().describe() << std::endl;
        }
    }
    out << "Goodbye." << std::endl;
    return domain::Status::Ok();
}

} // namespace vaultbreakdown::application
