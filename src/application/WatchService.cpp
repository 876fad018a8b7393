/**
 * @file WatchService.cpp
 * @brief Implementation of WatchService.
 */

#include "application/WatchService.hpp"
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace vaultbreakdown::application {

WatchService::WatchService(AppConfig config, std::shared_ptr<ChangeDetector> detector, RunFunction run)
    : m_config(std::move(config)),
      m_watchDir(m_config.watchDir()),
      m_detector(std::move(detector)),
      m_run(std::move(run)),
      m_channel(m_config.channelCapacity) {}

bool WatchService::IsQualifying(const std::string& path, const std::string& watchedDir) {
    std::error_code ec;
    fs::path p(path);
    if (p.extension() != ".md") return false;
    if (!fs::is_regular_file(p, ec) || ec) return false;

    fs::path parent = fs::weakly_canonical(p.parent_path(), ec);
    if (ec) return false;
    fs::path watched = fs::weakly_canonical(fs::path(watchedDir), ec);
    if (ec) return false;
    return parent == watched;
}

bool WatchService::enqueue(const std::string& path) {
    if (!IsQualifying(path, m_watchDir)) {
        if (m_config.verbose) {
            std::cout << "[WatchService] Ignoring " << path << std::endl;
        }
        return false;
    }
    if (!m_detector->shouldProcess(path)) {
        std::cout << "[WatchService] Already processed: " << path << std::endl;
        return false;
    }
    if (!m_channel.push(path)) {
        std::cerr << "[WatchService] Queue closed, dropping " << path << std::endl;
        return false;
    }
    std::cout << "[WatchService] Queued " << path << std::endl;
    return true;
}

domain::Status WatchService::catchUp() {
    auto items = m_detector->scan(m_watchDir);
    if (!items) {
        return items.error();
    }
    std::cout << "[WatchService] Catch-up scan found " << items->size() << " item(s)." << std::endl;
    for (const auto& item : *items) {
        enqueue(item);
    }
    return domain::Status::Ok();
}

domain::Status WatchService::processItem(const std::string& path) {
    if (!m_detector->shouldProcess(path)) {
        std::cout << "[WatchService] Skipping already processed " << path << std::endl;
        return domain::Status::Ok();
    }

    std::error_code ec;
    fs::path key = fs::weakly_canonical(fs::path(path), ec);
    if (ec) key = fs::absolute(fs::path(path), ec).lexically_normal();
    if (!m_attempted.insert(key.string()).second) {
        std::cout << "[WatchService] Skipping " << path << ", already attempted this session." << std::endl;
        return domain::Status::Ok();
    }

    RunReport report = m_run(path);
    if (!report.completed()) {
        ++m_failed;
        std::cerr << "[WatchService] Breakdown failed for " << path << " after "
                  << report.stepsCompleted << "/" << report.stepCount << " step(s)";
        if (report.error) std::cerr << ": " << report.error->describe();
        std::cerr << std::endl;
        return domain::Status::Ok();
    }

    ++m_completed;
    auto marked = m_detector->markProcessed(path);
    if (!marked) {
        return marked;
    }
    std::cout << "[WatchService] Completed " << path << " (" << report.stepCount << " step(s))." << std::endl;
    return domain::Status::Ok();
}

domain::Status WatchService::runConsumer() {
    std::cout << "[WatchService] Consumer started." << std::endl;
    while (auto item = m_channel.pop()) {
        auto status = processItem(*item);
        if (!status) {
            std::cerr << "[WatchService] Stopping: " << status.error().describe() << std::endl;
            m_channel.close();
            return status;
        }
    }
    std::cout << "[WatchService] Consumer stopped." << std::endl;
    return domain::Status::Ok();
}

domain::Status WatchService::scanOnce() {
    auto items = m_detector->scan(m_watchDir);
    if (!items) {
        return items.error();
    }
    std::cout << "[WatchService] Scan found " << items->size() << " new item(s)." << std::endl;
    for (const auto& item : *items) {
        auto status = processItem(item);
        if (!status) return status;
    }
    return domain::Status::Ok();
}

size_t WatchService::shutdown() {
    m_channel.close();
    const size_t dropped = m_channel.discard();
    if (dropped > 0) {
        std::cout << "[WatchService] Dropped " << dropped << " queued item(s); the next catch-up scan will pick them up."
                  << std::endl;
    }
    return dropped;
}

} // namespace vaultbreakdown::application
