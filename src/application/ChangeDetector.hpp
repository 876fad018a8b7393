/**
 * @file ChangeDetector.hpp
 * @brief Decides which newly created documents still need a breakdown.
 */

#pragma once

#include "domain/Result.hpp"
#include "domain/WatchStateRepository.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vaultbreakdown::application {

/**
 * @class ChangeDetector
 * @brief Sole owner of the WatchState.
 *
 * Items are identified by their resolved absolute path. An item that was
 * marked processed is never handed out again, whatever its mtime.
 */
class ChangeDetector {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param repo Durable state; loaded once here.
     * @param clock Time source for the scan start; defaults to system_clock::now.
     */
    explicit ChangeDetector(std::shared_ptr<domain::WatchStateRepository> repo, Clock clock = Clock());

    /** @brief False for anything already in the processed set. */
    bool shouldProcess(const std::string& item) const;

    /**
     * @brief Records item as processed and persists the set.
     * @return Persistence error when the set could not be written; the
     *         in-memory set is left unchanged in that case.
     */
    domain::Status markProcessed(const std::string& item);

    /**
     * @brief Lists direct .md children of directory modified after the last
     *        scan and not yet processed, then advances the last scan time to
     *        the moment this scan started.
     * @return Sorted resolved paths; Access error if the directory cannot be
     *         listed, Persistence error if the scan time cannot be saved.
     */
    domain::Result<std::vector<std::string>> scan(const std::string& directory);

    std::chrono::system_clock::time_point lastRunTime() const;
    size_t processedCount() const;

    /** @brief Absolute, normalized form of item used as its identity. */
    static std::string Resolve(const std::string& item);

    static bool HasMarkdownExtension(const std::string& path);

private:
    std::shared_ptr<domain::WatchStateRepository> m_repo;
    Clock m_clock;
    domain::WatchState m_state;
    mutable std::mutex m_mutex;
};

} // namespace vaultbreakdown::application
