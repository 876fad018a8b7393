/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AgentRole.hpp"
#include "application/AgentRunner.hpp"
#include "application/AppConfig.hpp"
#include "application/BreakdownOrchestrator.hpp"
#include "application/ChangeDetector.hpp"
#include "domain/AIService.hpp"
#include "domain/ToolHost.hpp"

namespace vaultbreakdown::application {

struct AppServices {
    AppConfig config;
    std::shared_ptr<domain::AIService> aiService;
    std::shared_ptr<domain::ToolHost> toolHost;   ///< Vault or MCP tools plus the breakdown tools.
    std::shared_ptr<AgentRunner> runner;
    std::shared_ptr<ChangeDetector> changeDetector;
    std::shared_ptr<BreakdownOrchestrator> orchestrator;
    AgentRole planner;
    AgentRole executor;
};

} // namespace vaultbreakdown::application
