/**
 * @file BreakdownOrchestrator.cpp
 * @brief Implementation of BreakdownOrchestrator.
 */

#include "application/BreakdownOrchestrator.hpp"
#include "application/PlanInterpreter.hpp"
#include "infrastructure/PathUtils.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

namespace vaultbreakdown::application {

std::string RunReport::StateToString(RunState state) {
    switch (state) {
        case RunState::Idle: return "idle";
        case RunState::Planning: return "planning";
        case RunState::Executing: return "executing";
        case RunState::Completed: return "completed";
        case RunState::Failed: return "failed";
    }
    return "idle";
}

BreakdownOrchestrator::BreakdownOrchestrator(AppConfig config, std::shared_ptr<AgentRunner> runner,
                                             AgentRole planner, AgentRole executor)
    : m_config(std::move(config)),
      m_runner(std::move(runner)),
      m_planner(std::move(planner)),
      m_executor(std::move(executor)) {}

std::string BreakdownOrchestrator::vaultRelative(const std::string& itemPath) const {
    return infrastructure::PathUtils::RelativeTo(itemPath, m_config.vaultPath);
}

std::string BreakdownOrchestrator::BuildPlannerTask(const std::string& articlePath, const std::string& content) {
    return "User request: Break down the article located at " + articlePath +
           "\n\nArticle Content:\n" + content;
}

void BreakdownOrchestrator::cancelCurrentStep() {
    std::lock_guard<std::mutex> lock(m_tokenMutex);
    m_currentToken.cancel();
}

RunReport BreakdownOrchestrator::fail(RunReport report, domain::Error error) const {
    std::cerr << "[Orchestrator] Run failed for " << report.item << " (" << error.describe() << ")" << std::endl;
    report.state = RunState::Failed;
    report.error = std::move(error);
    return report;
}

RunReport BreakdownOrchestrator::run(const std::string& itemPath) {
    RunReport report;
    report.item = itemPath;
    const std::string articlePath = vaultRelative(itemPath);
    std::cout << "[Orchestrator] --- Starting breakdown of " << articlePath << " ---" << std::endl;

    // Pre-processing: read the article
    std::string content;
    {
        std::ifstream file(itemPath, std::ios::binary);
        if (!file.is_open()) {
            return fail(report, {domain::ErrorKind::Access, "cannot open " + itemPath});
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            return fail(report, {domain::ErrorKind::Access, "read error on " + itemPath});
        }
        content = buffer.str();
    }
    std::cout << "[Orchestrator] Read " << content.size() << " chars." << std::endl;

    // Planning
    report.state = RunState::Planning;
    CancellationToken planToken;
    {
        std::lock_guard<std::mutex> lock(m_tokenMutex);
        m_currentToken = planToken;
    }
    auto plan = m_runner->complete(m_planner, BuildPlannerTask(articlePath, content), planToken);
    if (!plan) {
        const auto& err = plan.error();
        // Cancellation and limits keep their kind; anything else while planning is a planning error.
        if (err.kind == domain::ErrorKind::Cancelled || err.kind == domain::ErrorKind::LimitReached) {
            return fail(report, err);
        }
        return fail(report, {domain::ErrorKind::Planning, "planner failed: " + err.describe()});
    }
    if (plan->find_first_not_of(" \t\r\n") == std::string::npos) {
        return fail(report, {domain::ErrorKind::Planning, "planner returned an empty plan"});
    }

    const std::vector<std::string> steps = PlanInterpreter::ExtractSteps(*plan);
    report.stepCount = steps.size();
    if (steps.empty()) {
        std::cerr << "[Orchestrator] Plan had no numbered steps:\n" << *plan << std::endl;
        return fail(report, {domain::ErrorKind::Planning, "no numbered steps in plan"});
    }
    std::cout << "[Orchestrator] Plan has " << steps.size() << " step(s)." << std::endl;

    // Executing
    report.state = RunState::Executing;
    for (size_t i = 0; i < steps.size(); ++i) {
        const StepKind kind = PlanInterpreter::Classify(steps[i]);
        const std::string task = PlanInterpreter::Enrich(steps[i], kind, content, articlePath);
        std::cout << "[Orchestrator] Step " << (i + 1) << "/" << steps.size()
                  << " [" << PlanInterpreter::KindToString(kind) << "]: " << steps[i] << std::endl;

        CancellationToken stepToken;
        {
            std::lock_guard<std::mutex> lock(m_tokenMutex);
            // A cancel that arrived between steps applies to the next one.
            if (m_currentToken.isCancelled()) stepToken.cancel();
            m_currentToken = stepToken;
        }
        auto outcome = m_runner->complete(m_executor, task, stepToken);
        if (!outcome) {
            const auto& err = outcome.error();
            return fail(report, {err.kind, "step " + std::to_string(i + 1) + " (" + steps[i] + "): " + err.message});
        }
        if (m_config.verbose) {
            std::cout << "[Orchestrator] Executor: " << *outcome << std::endl;
        }
        report.stepsCompleted = i + 1;
    }

    report.state = RunState::Completed;
    std::cout << "[Orchestrator] --- Finished breakdown of " << articlePath << " ---" << std::endl;
    return report;
}

} // namespace vaultbreakdown::application
