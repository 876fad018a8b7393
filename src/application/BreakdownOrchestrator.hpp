/**
 * @file BreakdownOrchestrator.hpp
 * @brief Plan-then-execute run for one change-detected article.
 */

#pragma once

#include "application/AgentRole.hpp"
#include "application/AgentRunner.hpp"
#include "application/AppConfig.hpp"
#include "domain/Result.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vaultbreakdown::application {

/**
 * @enum RunState
 * @brief Idle -> Planning -> Executing(i) -> Completed | Failed.
 */
enum class RunState {
    Idle,
    Planning,
    Executing,
    Completed,
    Failed
};

/**
 * @struct RunReport
 * @brief Outcome of one run. Only a Completed run may be marked processed.
 */
struct RunReport {
    std::string item;
    RunState state = RunState::Idle;
    std::optional<domain::Error> error;
    size_t stepsCompleted = 0;
    size_t stepCount = 0;

    bool completed() const { return state == RunState::Completed; }
    static std::string StateToString(RunState state);
};

/**
 * @class BreakdownOrchestrator
 * @brief Reads the article, asks the planner for steps, then runs each step on the executor.
 *
 * Steps run strictly in order, each with its own cancellation token. The
 * first failing step fails the run and the remaining steps are skipped.
 */
class BreakdownOrchestrator {
public:
    /**
     * @param config Vault location and limits.
     * @param runner Shared tool loop.
     * @param planner Planner capability set.
     * @param executor Executor capability set.
     */
    BreakdownOrchestrator(AppConfig config, std::shared_ptr<AgentRunner> runner,
                          AgentRole planner, AgentRole executor);

    /** @param itemPath Absolute or working-directory-relative path of the article. */
    RunReport run(const std::string& itemPath);

    /** @brief Path of item relative to the vault root, with '/' separators. */
    std::string vaultRelative(const std::string& itemPath) const;

    static std::string BuildPlannerTask(const std::string& articlePath, const std::string& content);

    /**
     * @brief Cancels the planning call or step currently executing.
     * Called between steps, it cancels the next step instead.
     */
    void cancelCurrentStep();

private:
    RunReport fail(RunReport report, domain::Error error) const;

    AppConfig m_config;
    std::shared_ptr<AgentRunner> m_runner;
    AgentRole m_planner;
    AgentRole m_executor;
    std::mutex m_tokenMutex;
    CancellationToken m_currentToken;
};

} // namespace vaultbreakdown::application
