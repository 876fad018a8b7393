/**
 * @file WatchService.hpp
 * @brief Single-consumer pipeline from creation events to breakdown runs.
 */

#pragma once

#include "application/AppConfig.hpp"
#include "application/BoundedChannel.hpp"
#include "application/BreakdownOrchestrator.hpp"
#include "application/ChangeDetector.hpp"
#include "domain/Result.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <set>
#include <string>

namespace vaultbreakdown::application {

/**
 * @class WatchService
 * @brief Filters events, queues them and runs one breakdown per item, in order.
 *
 * Producers (the watcher thread, the catch-up scan) call enqueue(); a single
 * consumer drains the queue in runConsumer(). An item is marked processed only
 * when its run completes.
 */
class WatchService {
public:
    using RunFunction = std::function<RunReport(const std::string& item)>;

    WatchService(AppConfig config, std::shared_ptr<ChangeDetector> detector, RunFunction run);

    /**
     * @brief Queues path if it qualifies and has not been processed.
     * @return True if the path was queued.
     */
    bool enqueue(const std::string& path);

    /** @brief Queues everything the change detector finds in the watched directory. */
    domain::Status catchUp();

    /**
     * @brief Drains the queue until shutdown().
     * Failed runs are logged and skipped; a path is attempted at most once per session.
     * @return Persistence error if the processed set could not be saved (the queue is closed).
     */
    domain::Status runConsumer();

    /**
     * @brief Runs the item unless already processed or already attempted by this service;
     * marks it processed on success.
     */
    domain::Status processItem(const std::string& path);

    /** @brief Scans once and processes every new item synchronously. */
    domain::Status scanOnce();

    /**
     * @brief Closes the queue and drops the items still waiting in it.
     * Dropped items stay unmarked, so the next catch-up scan finds them again.
     * @return Number of dropped items.
     */
    size_t shutdown();

    /**
     * @brief Regular .md file whose parent directory is watchedDir.
     */
    static bool IsQualifying(const std::string& path, const std::string& watchedDir);

    size_t completedRuns() const { return m_completed.load(); }
    size_t failedRuns() const { return m_failed.load(); }
    const std::string& watchDir() const { return m_watchDir; }

private:
    AppConfig m_config;
    std::string m_watchDir;
    std::shared_ptr<ChangeDetector> m_detector;
    RunFunction m_run;
    BoundedChannel<std::string> m_channel;
    std::atomic<size_t> m_completed{0};
    std::atomic<size_t> m_failed{0};
    std::set<std::string> m_attempted; ///< Consumer thread only.
};

} // namespace vaultbreakdown::application
