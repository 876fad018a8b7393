/**
 * @file ChatSession.hpp
 * @brief Line-oriented interactive session over the executor role.
 */

#pragma once

#include "application/AgentRole.hpp"
#include "application/AgentRunner.hpp"
#include "application/AppConfig.hpp"
#include "domain/Result.hpp"
#include "domain/ToolHost.hpp"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace vaultbreakdown::application {

/**
 * @class ChatSession
 * @brief REPL: each input line is one executor turn on a persistent conversation.
 *
 * Commands: /help, /status, /quit. After maxChatTurns turns further input is
 * refused with "limit reached" and the session ends.
 */
class ChatSession {
public:
    using ChatMessage = AgentRunner::ChatMessage;

    ChatSession(AppConfig config, std::shared_ptr<AgentRunner> runner, AgentRole executor,
                std::shared_ptr<domain::ToolHost> tools);

    /**
     * @brief Reads lines from in until /quit, end of input or the turn cap.
     * @return Ok on /quit or end of input, LimitReached when the cap ended the session.
     */
    domain::Status run(std::istream& in, std::ostream& out);

    /**
     * @brief Sends one user line as a turn.
     * A failed turn is rolled back out of the history but still counts.
     */
    domain::Result<std::string> send(const std::string& line);

    int turnCount() const { return m_turns; }
    const std::vector<ChatMessage>& history() const { return m_history; }

    static void PrintHelp(std::ostream& out);

private:
    void printStatus(std::ostream& out) const;

    AppConfig m_config;
    std::shared_ptr<AgentRunner> m_runner;
    AgentRole m_executor;
    std::shared_ptr<domain::ToolHost> m_tools;
    std::vector<ChatMessage> m_history;
    int m_turns = 0;
};

} // namespace vaultbreakdown::application
