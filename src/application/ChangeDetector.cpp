/**
 * @file ChangeDetector.cpp
 * @brief Implementation of ChangeDetector.
 */

#include "application/ChangeDetector.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace vaultbreakdown::application {

ChangeDetector::ChangeDetector(std::shared_ptr<domain::WatchStateRepository> repo, Clock clock)
    : m_repo(std::move(repo)), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = [] { return std::chrono::system_clock::now(); };
    }
    m_state = m_repo->load();
    std::cout << "[ChangeDetector] Loaded state: " << m_state.processedItems.size()
              << " processed item(s), last run "
              << infrastructure::TimeUtils::ToIso8601Utc(m_state.lastRunTime) << std::endl;
}

std::string ChangeDetector::Resolve(const std::string& item) {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(fs::path(item), ec);
    if (ec) {
        resolved = fs::absolute(fs::path(item), ec).lexically_normal();
        if (ec) return fs::path(item).lexically_normal().string();
    }
    return resolved.string();
}

bool ChangeDetector::HasMarkdownExtension(const std::string& path) {
    return fs::path(path).extension() == ".md";
}

bool ChangeDetector::shouldProcess(const std::string& item) const {
    std::string key = Resolve(item);
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.processedItems.find(key) == m_state.processedItems.end();
}

domain::Status ChangeDetector::markProcessed(const std::string& item) {
    std::string key = Resolve(item);
    std::lock_guard<std::mutex> lock(m_mutex);

    auto updated = m_state.processedItems;
    updated.insert(key);
    auto status = m_repo->saveProcessedItems(updated);
    if (!status) {
        std::cerr << "[ChangeDetector] Failed to persist processed set: " << status.error().message << std::endl;
        return status;
    }
    m_state.processedItems = std::move(updated);
    std::cout << "[ChangeDetector] Marked processed: " << key << std::endl;
    return domain::Status::Ok();
}

domain::Result<std::vector<std::string>> ChangeDetector::scan(const std::string& directory) {
    const auto scanStart = m_clock();
    std::vector<std::string> fresh;

    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        std::cerr << "[ChangeDetector] Cannot list " << directory << ": " << ec.message() << std::endl;
        return domain::Result<std::vector<std::string>>::Fail(domain::ErrorKind::Access,
                                                             "cannot list " + directory + ": " + ec.message());
    }

    std::chrono::system_clock::time_point since;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        since = m_state.lastRunTime;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::error_code statEc;
        if (!entry.is_regular_file(statEc) || statEc) continue;
        if (!HasMarkdownExtension(entry.path().string())) continue;

        auto ftime = entry.last_write_time(statEc);
        if (statEc) {
            std::cerr << "[ChangeDetector] Skipping " << entry.path() << ": " << statEc.message() << std::endl;
            continue;
        }
        if (infrastructure::TimeUtils::FromFileTime(ftime) <= since) continue;

        std::string resolved = Resolve(entry.path().string());
        if (shouldProcess(resolved)) {
            fresh.push_back(resolved);
        }
    }
    if (ec) {
        std::cerr << "[ChangeDetector] Listing of " << directory << " stopped early: " << ec.message() << std::endl;
    }
    std::sort(fresh.begin(), fresh.end());

    std::lock_guard<std::mutex> lock(m_mutex);
    m_state.lastRunTime = scanStart;
    auto status = m_repo->saveLastRunTime(scanStart);
    if (!status) {
        std::cerr << "[ChangeDetector] Failed to persist last run time: " << status.error().message << std::endl;
        return status.error();
    }

    std::cout << "[ChangeDetector] Scan of " << directory << " found " << fresh.size() << " new item(s)." << std::endl;
    return fresh;
}

std::chrono::system_clock::time_point ChangeDetector::lastRunTime() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.lastRunTime;
}

size_t ChangeDetector::processedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.processedItems.size();
}

} // namespace vaultbreakdown::application
