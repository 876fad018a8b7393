/**
 * @file AgentRunner.cpp
 * @brief Implementation of AgentRunner.
 */

#include "application/AgentRunner.hpp"
#include <iostream>

namespace vaultbreakdown::application {

AgentRunner::AgentRunner(std::shared_ptr<domain::AIService> ai,
                         std::shared_ptr<domain::ToolHost> tools,
                         int maxToolRounds,
                         bool verbose)
    : m_ai(std::move(ai)), m_tools(std::move(tools)), m_maxToolRounds(maxToolRounds), m_verbose(verbose) {}

domain::Result<std::string> AgentRunner::complete(const AgentRole& role, const std::string& task,
                                                  const CancellationToken& token) {
    std::vector<ChatMessage> history;
    history.push_back(ChatMessage::System(role.systemPrompt));
    history.push_back(ChatMessage::User(task));
    return runTurn(role, history, token);
}

AgentRunner::ChatMessage AgentRunner::executeTool(const domain::AIService::ToolCall& call) {
    ChatMessage result;
    result.role = ChatMessage::Role::Tool;
    result.toolName = call.name;

    if (!m_tools) {
        result.content = "Error: no tool host available";
        std::cerr << "[AgentRunner] Tool call " << call.name << " with no tool host." << std::endl;
        return result;
    }

    if (m_verbose) {
        std::cout << "[AgentRunner] -> " << call.name << " " << call.arguments.dump() << std::endl;
    }
    domain::ToolResult outcome = m_tools->call(call.name, call.arguments);
    if (outcome.ok) {
        result.content = outcome.text;
        if (m_verbose) {
            std::cout << "[AgentRunner] <- " << call.name << ": " << outcome.text.substr(0, 200) << std::endl;
        }
    } else {
        result.content = "Error: " + outcome.text;
        std::cerr << "[AgentRunner] Tool " << call.name << " failed: " << outcome.text << std::endl;
    }
    return result;
}

domain::Result<std::string> AgentRunner::runTurn(const AgentRole& role, std::vector<ChatMessage>& history,
                                                 const CancellationToken& token) {
    int rounds = 0;
    while (true) {
        if (token.isCancelled()) {
            return domain::Result<std::string>::Fail(domain::ErrorKind::Cancelled, "turn cancelled");
        }

        auto reply = m_ai->chat(history, role.tools);
        if (!reply) {
            return reply.error();
        }
        ChatMessage message = std::move(reply.value());
        message.role = ChatMessage::Role::Assistant;

        if (!role.usesTools() && !message.toolCalls.empty()) {
            std::cerr << "[AgentRunner] Ignoring " << message.toolCalls.size() << " tool call(s) from the "
                      << AgentRole::RoleToString(role.role) << std::endl;
            message.toolCalls.clear();
        }

        const std::vector<domain::AIService::ToolCall> calls = message.toolCalls;
        history.push_back(std::move(message));

        if (calls.empty()) {
            return history.back().content;
        }

        if (rounds >= m_maxToolRounds) {
            std::cerr << "[AgentRunner] Tool round limit (" << m_maxToolRounds << ") reached." << std::endl;
            return domain::Result<std::string>::Fail(
                domain::ErrorKind::LimitReached,
                "model still requesting tools after " + std::to_string(m_maxToolRounds) + " rounds");
        }
        ++rounds;

        for (const auto& call : calls) {
            if (token.isCancelled()) {
                return domain::Result<std::string>::Fail(domain::ErrorKind::Cancelled, "turn cancelled");
            }
            history.push_back(executeTool(call));
        }
    }
}

} // namespace vaultbreakdown::application
