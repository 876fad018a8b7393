/**
 * @file InotifyWatcher.hpp
 * @brief Non-recursive creation watcher for one directory (Linux inotify).
 */

#pragma once
#include "domain/Result.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace vaultbreakdown::infrastructure {

/**
 * @class InotifyWatcher
 * @brief Reports files created in a directory once their content is complete.
 *
 * IN_CREATE marks a name pending and the following IN_CLOSE_WRITE reports it;
 * IN_MOVED_TO and directory creation are reported immediately.
 */
class InotifyWatcher {
public:
    using Callback = std::function<void(const std::string& path)>;

    explicit InotifyWatcher(std::string directory, int pollTimeoutMs = 250);
    ~InotifyWatcher();

    InotifyWatcher(const InotifyWatcher&) = delete;
    InotifyWatcher& operator=(const InotifyWatcher&) = delete;

    /** @brief Adds the watch and starts the watcher thread. */
    domain::Status start(Callback onCreated);

    /** @brief Stops and joins the watcher thread. Safe to call twice. */
    void stop();

    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Applies one event to the pending set.
     * @return Full path to report, if any.
     */
    std::optional<std::string> handleEvent(uint32_t mask, const std::string& name);

    const std::string& directory() const { return m_directory; }

private:
    void watchLoop();

    std::string m_directory;
    int m_pollTimeoutMs;
    int m_inotifyFd = -1;
    int m_watchDescriptor = -1;
    Callback m_callback;
    std::set<std::string> m_pending;
    std::mutex m_pendingMutex;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
};

} // namespace vaultbreakdown::infrastructure
