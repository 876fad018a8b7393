/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the system prompts of the planner and executor roles.
 */

#pragma once

#include <string>

namespace vaultbreakdown::infrastructure {

class PromptCatalog {
public:
    /** @brief Instructions for the planner: answer with a numbered step list only. */
    static std::string GetPlannerPrompt();

    /** @brief Instructions for the executor: carry out one step with the vault tools. */
    static std::string GetExecutorPrompt();

    /** @brief Instructions for the interactive chat session. */
    static std::string GetChatPrompt();

    /**
     * @brief Reads a prompt override from disk.
     * @return File content, or fallback when path is empty or unreadable.
     */
    static std::string LoadOrDefault(const std::string& path, const std::string& fallback);
};

} // namespace vaultbreakdown::infrastructure
