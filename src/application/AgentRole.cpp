#include "application/AgentRole.hpp"

namespace vaultbreakdown::application {

AgentRole AgentRole::Planner(std::string systemPrompt) {
    AgentRole r;
    r.role = Role::Planner;
    r.systemPrompt = std::move(systemPrompt);
    return r;
}

AgentRole AgentRole::Executor(std::string systemPrompt, std::vector<domain::ToolSpec> tools) {
    AgentRole r;
    r.role = Role::Executor;
    r.systemPrompt = std::move(systemPrompt);
    r.tools = std::move(tools);
    return r;
}

std::string AgentRole::RoleToString(Role role) {
    switch (role) {
        case Role::Planner: return "planner";
        case Role::Executor: return "executor";
    }
    return "executor";
}

} // namespace vaultbreakdown::application
