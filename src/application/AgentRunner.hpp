/**
 * @file AgentRunner.hpp
 * @brief Drives one model turn, executing requested tools until the model answers.
 */

#pragma once

#include "application/AgentRole.hpp"
#include "application/CancellationToken.hpp"
#include "domain/AIService.hpp"
#include "domain/Result.hpp"
#include "domain/ToolHost.hpp"
#include <memory>
#include <string>
#include <vector>

namespace vaultbreakdown::application {

/**
 * @class AgentRunner
 * @brief Bounded tool-use loop shared by the orchestrator and the chat session.
 */
class AgentRunner {
public:
    using ChatMessage = domain::AIService::ChatMessage;

    /**
     * @param ai Model transport.
     * @param tools Host that executes tool calls; may be null for tool-less roles.
     * @param maxToolRounds Consecutive tool-use rounds allowed in one turn.
     * @param verbose Log every tool call and its result.
     */
    AgentRunner(std::shared_ptr<domain::AIService> ai,
                std::shared_ptr<domain::ToolHost> tools,
                int maxToolRounds,
                bool verbose = false);

    /**
     * @brief One-shot conversation: system prompt, the task, then one turn.
     * @return The model's final text.
     */
    domain::Result<std::string> complete(const AgentRole& role, const std::string& task,
                                         const CancellationToken& token);

    /**
     * @brief Runs one turn on an existing conversation.
     *
     * The model's messages and every tool result are appended to history.
     * Tool failures are recorded as tool results, never returned as errors.
     * @return Final assistant text, or Transport / LimitReached / Cancelled.
     */
    domain::Result<std::string> runTurn(const AgentRole& role, std::vector<ChatMessage>& history,
                                        const CancellationToken& token);

    int maxToolRounds() const { return m_maxToolRounds; }

private:
    ChatMessage executeTool(const domain::AIService::ToolCall& call);

    std::shared_ptr<domain::AIService> m_ai;
    std::shared_ptr<domain::ToolHost> m_tools;
    int m_maxToolRounds;
    bool m_verbose;
};

} // namespace vaultbreakdown::application
