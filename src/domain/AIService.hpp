/**
 * @file AIService.hpp
 * @brief Interface for the language model that plans and executes breakdowns.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Result.hpp"
#include "domain/ToolHost.hpp"

namespace vaultbreakdown::domain {

/**
 * @class AIService
 * @brief Abstract chat model with optional tool calling.
 */
class AIService {
public:
    virtual ~AIService() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /**
     * @struct ToolCall
     * @brief A tool invocation requested by the model.
     */
    struct ToolCall {
        std::string name;
        nlohmann::json arguments = nlohmann::json::object();
    };

    /**
     * @struct ChatMessage
     * @brief Represents a single message in a chat conversation.
     */
    struct ChatMessage {
        enum class Role { System, User, Assistant, Tool };
        Role role = Role::User;
        std::string content;
        std::vector<ToolCall> toolCalls; ///< Assistant messages only.
        std::string toolName;            ///< Tool messages only.

        static std::string RoleToString(Role r) {
            switch(r) {
                case Role::System: return "system";
                case Role::User: return "user";
                case Role::Assistant: return "assistant";
                case Role::Tool: return "tool";
            }
            return "user";
        }

        static ChatMessage System(std::string text) { return {Role::System, std::move(text), {}, {}}; }
        static ChatMessage User(std::string text) { return {Role::User, std::move(text), {}, {}}; }
    };

    /**
     * @brief Sends the conversation to the model and returns its next message.
     * @param history The conversation so far.
     * @param tools Tools the model may request; empty for a plain completion.
     * @return The assistant message, or a Transport error.
     */
    virtual Result<ChatMessage> chat(const std::vector<ChatMessage>& history,
                                     const std::vector<ToolSpec>& tools) = 0;

    /**
     * @brief Gets the name of the currently selected AI model.
     * @return The model name.
     */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace vaultbreakdown::domain
