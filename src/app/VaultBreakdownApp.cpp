/**
 * @file VaultBreakdownApp.cpp
 * @brief Implementation of the VaultBreakdownApp class.
 */
#include "app/VaultBreakdownApp.hpp"

#include "application/BreakdownTools.hpp"
#include "application/ChatSession.hpp"
#include "application/WatchService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/InotifyWatcher.hpp"
#include "infrastructure/McpToolHost.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/VaultToolHost.hpp"
#include "infrastructure/WatchStateStore.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

namespace vaultbreakdown::app {

namespace {

std::atomic<bool> g_stopRequested{false};

void HandleStopSignal(int) {
    g_stopRequested.store(true);
}

void InstallSignalHandlers() {
    std::signal(SIGINT, HandleStopSignal);
    std::signal(SIGTERM, HandleStopSignal);
}

} // namespace

VaultBreakdownApp::VaultBreakdownApp() = default;

VaultBreakdownApp::~VaultBreakdownApp() {
    Shutdown();
}

void VaultBreakdownApp::PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  watch        Process new articles in the watched folder as they appear\n"
              << "  scan         Process articles created since the last run, then exit\n"
              << "  run <file>   Break down one article (ignores the processed set)\n"
              << "  chat         Interactive session with the vault tools\n"
              << "\n"
              << "Configuration: settings.json in the config home, overridden by\n"
              << "VAULT_PATH, MCP_PATH, OLLAMA_MODEL, OLLAMA_HOST, OLLAMA_PORT,\n"
              << "VAULT_BREAKDOWN_STATE_DIR." << std::endl;
}

bool VaultBreakdownApp::Init() {
    auto config = infrastructure::ConfigLoader::LoadDefault();
    if (!config) {
        std::cerr << "[VaultBreakdownApp] " << config.error().describe() << std::endl;
        return false;
    }
    m_services.config = *config;
    const application::AppConfig& cfg = m_services.config;

    if (!std::filesystem::is_directory(cfg.vaultPath)) {
        std::cerr << "[VaultBreakdownApp] Vault directory not found: " << cfg.vaultPath << std::endl;
        return false;
    }

    // Writes from the MCP server and the pipe closing under us must not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    // Dependency Injection / Composition Root
    auto vaultTools = std::make_shared<infrastructure::VaultToolHost>(cfg.vaultPath);
    std::shared_ptr<domain::ToolHost> baseTools = vaultTools;
    if (!cfg.mcpPath.empty()) {
        m_mcp = std::make_shared<infrastructure::McpToolHost>(
            cfg.nodeExecutable, std::vector<std::string>{cfg.mcpPath, cfg.vaultPath}, 120000, cfg.verbose);
        auto started = m_mcp->start();
        if (!started) {
            std::cerr << "[VaultBreakdownApp] Could not start tool host: " << started.error().describe() << std::endl;
            return false;
        }
        baseTools = m_mcp;
    }

    auto writer = [vaultTools](const std::string& path, const std::string& content) {
        return vaultTools->writeFile(path, content);
    };
    m_services.toolHost = std::make_shared<application::BreakdownTools>(baseTools, writer);

    auto ai = std::make_shared<infrastructure::OllamaAdapter>(cfg.ollamaHost, cfg.ollamaPort, cfg.model);
    ai->initialize();
    m_services.aiService = ai;

    m_services.runner = std::make_shared<application::AgentRunner>(
        m_services.aiService, m_services.toolHost, cfg.maxToolRounds, cfg.verbose);

    m_services.planner = application::AgentRole::Planner(infrastructure::PromptCatalog::LoadOrDefault(
        cfg.plannerPromptPath, infrastructure::PromptCatalog::GetPlannerPrompt()));
    m_services.executor = application::AgentRole::Executor(
        infrastructure::PromptCatalog::LoadOrDefault(cfg.executorPromptPath,
                                                     infrastructure::PromptCatalog::GetExecutorPrompt()),
        m_services.toolHost->listTools());

    auto store = std::make_shared<infrastructure::WatchStateStore>(cfg.stateDir);
    m_services.changeDetector = std::make_shared<application::ChangeDetector>(store);
    m_services.orchestrator = std::make_shared<application::BreakdownOrchestrator>(
        cfg, m_services.runner, m_services.planner, m_services.executor);

    std::cout << "[VaultBreakdownApp] Vault: " << cfg.vaultPath << std::endl;
    std::cout << "[VaultBreakdownApp] Model: " << ai->getCurrentModel() << std::endl;
    std::cout << "[VaultBreakdownApp] Tools: " << m_services.toolHost->describe() << std::endl;
    return true;
}

void VaultBreakdownApp::Shutdown() {
    if (m_mcp) {
        m_mcp->stop();
        m_mcp.reset();
    }
}

int VaultBreakdownApp::Run(int argc, char** argv) {
    const char* program = argc > 0 ? argv[0] : "vault-breakdown";
    if (argc < 2) {
        PrintUsage(program);
        return 1;
    }

    const std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        PrintUsage(program);
        return 0;
    }
    if (command != "watch" && command != "scan" && command != "run" && command != "chat") {
        std::cerr << "Unknown command: " << command << std::endl;
        PrintUsage(program);
        return 1;
    }
    if (command == "run" && argc < 3) {
        std::cerr << "run: missing <file>" << std::endl;
        return 1;
    }

    if (!Init()) {
        return 1;
    }

    int code = 0;
    if (command == "watch") code = RunWatch();
    else if (command == "scan") code = RunScan();
    else if (command == "run") code = RunSingle(argv[2]);
    else code = RunChat();

    Shutdown();
    return code;
}

int VaultBreakdownApp::RunWatch() {
    const auto& cfg = m_services.config;
    auto orchestrator = m_services.orchestrator;
    application::WatchService service(cfg, m_services.changeDetector,
                                      [orchestrator](const std::string& item) { return orchestrator->run(item); });

    std::error_code ec;
    std::filesystem::create_directories(service.watchDir(), ec);

    InstallSignalHandlers();

    infrastructure::InotifyWatcher watcher(service.watchDir());
    auto started = watcher.start([&service](const std::string& path) { service.enqueue(path); });
    if (!started) {
        std::cerr << "[VaultBreakdownApp] " << started.error().describe() << std::endl;
        return 1;
    }

    std::atomic<bool> consumerDone{false};
    domain::Status consumerStatus;
    std::thread consumer([&]() {
        consumerStatus = service.runConsumer();
        consumerDone.store(true);
    });

    auto caught = service.catchUp();
    if (!caught) {
        std::cerr << "[VaultBreakdownApp] Catch-up scan failed: " << caught.error().describe() << std::endl;
    }

    std::cout << "[VaultBreakdownApp] Watching " << service.watchDir() << " (Ctrl+C to stop)" << std::endl;
    while (!g_stopRequested.load() && !consumerDone.load() && watcher.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[VaultBreakdownApp] Stopping..." << std::endl;
    watcher.stop();
    service.shutdown();
    orchestrator->cancelCurrentStep();
    consumer.join();

    std::cout << "[VaultBreakdownApp] Completed " << service.completedRuns() << ", failed "
              << service.failedRuns() << "." << std::endl;
    return consumerStatus ? 0 : 1;
}

int VaultBreakdownApp::RunScan() {
    auto orchestrator = m_services.orchestrator;
    application::WatchService service(m_services.config, m_services.changeDetector,
                                      [orchestrator](const std::string& item) { return orchestrator->run(item); });
    auto status = service.scanOnce();
    if (!status) {
        std::cerr << "[VaultBreakdownApp] Scan failed: " << status.error().describe() << std::endl;
        return 1;
    }
    std::cout << "[VaultBreakdownApp] Completed " << service.completedRuns() << ", failed "
              << service.failedRuns() << "." << std::endl;
    return service.failedRuns() == 0 ? 0 : 2;
}

int VaultBreakdownApp::RunSingle(const std::string& path) {
    auto report = m_services.orchestrator->run(path);
    if (!report.completed()) {
        std::cerr << "[VaultBreakdownApp] Run " << application::RunReport::StateToString(report.state);
        if (report.error) std::cerr << ": " << report.error->describe();
        std::cerr << std::endl;
        return 1;
    }
    auto marked = m_services.changeDetector->markProcessed(path);
    if (!marked) {
        std::cerr << "[VaultBreakdownApp] " << marked.error().describe() << std::endl;
        return 1;
    }
    std::cout << "[VaultBreakdownApp] Completed " << report.stepCount << " step(s)." << std::endl;
    return 0;
}

int VaultBreakdownApp::RunChat() {
    auto chatRole = application::AgentRole::Executor(infrastructure::PromptCatalog::GetChatPrompt(),
                                                     m_services.executor.tools);
    application::ChatSession session(m_services.config, m_services.runner, chatRole, m_services.toolHost);
    auto status = session.run(std::cin, std::cout);
    return status ? 0 : 1;
}

} // namespace vaultbreakdown::app
