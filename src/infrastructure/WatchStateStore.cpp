/**
 * @file WatchStateStore.cpp
 * @brief Implementation of the WatchStateStore class.
 */
#include "infrastructure/WatchStateStore.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace vaultbreakdown::infrastructure {

WatchStateStore::WatchStateStore(const std::string& stateDir)
    : m_stateDir(stateDir) {}

domain::WatchState WatchStateStore::load() {
    domain::WatchState state;

    fs::path lastRunPath = fs::path(m_stateDir) / kLastRunFile;
    std::ifstream lastRunFile(lastRunPath);
    if (lastRunFile.is_open()) {
        std::stringstream buffer;
        buffer << lastRunFile.rdbuf();
        auto parsed = TimeUtils::ParseIso8601(buffer.str());
        if (parsed) {
            state.lastRunTime = *parsed;
        } else {
            std::cerr << "[WatchStateStore] Unreadable timestamp in " << lastRunPath
                      << ", treating as never run." << std::endl;
        }
    }

    fs::path processedPath = fs::path(m_stateDir) / kProcessedFile;
    std::ifstream processedFile(processedPath);
    if (processedFile.is_open()) {
        try {
            nlohmann::json j;
            processedFile >> j;
            if (!j.is_array()) {
                throw std::runtime_error("expected a JSON array");
            }
            for (const auto& item : j) {
                if (item.is_string()) {
                    state.processedItems.insert(item.get<std::string>());
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[WatchStateStore] Corrupt " << processedPath << " (" << e.what()
                      << "), starting with an empty set." << std::endl;
            state.processedItems.clear();
        }
    }

    return state;
}

domain::Status WatchStateStore::saveLastRunTime(std::chrono::system_clock::time_point runTime) {
    fs::path path = fs::path(m_stateDir) / kLastRunFile;
    return AtomicFileWriter::Write(path.string(), TimeUtils::ToIso8601Utc(runTime));
}

domain::Status WatchStateStore::saveProcessedItems(const std::set<std::string>& items) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& item : items) {
        j.push_back(item);
    }
    fs::path path = fs::path(m_stateDir) / kProcessedFile;
    return AtomicFileWriter::Write(path.string(), j.dump(2));
}

} // namespace vaultbreakdown::infrastructure
