/**
 * @file AgentRole.hpp
 * @brief Capability set (system prompt + tools) of the planner and executor.
 */

#pragma once

#include "domain/ToolHost.hpp"
#include <string>
#include <vector>

namespace vaultbreakdown::application {

enum class Role {
    Planner,  ///< Produces the numbered plan; never calls tools.
    Executor  ///< Carries out one step at a time through tools.
};

/**
 * @struct AgentRole
 * @brief What one model conversation is allowed to do.
 */
struct AgentRole {
    Role role = Role::Executor;
    std::string systemPrompt;
    std::vector<domain::ToolSpec> tools;

    bool usesTools() const { return !tools.empty(); }

    static AgentRole Planner(std::string systemPrompt);
    static AgentRole Executor(std::string systemPrompt, std::vector<domain::ToolSpec> tools);
    static std::string RoleToString(Role role);
};

} // namespace vaultbreakdown::application
