/**
 * @file InotifyWatcher.cpp
 * @brief Implementation of InotifyWatcher.
 */

#include "infrastructure/InotifyWatcher.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace vaultbreakdown::infrastructure {

InotifyWatcher::InotifyWatcher(std::string directory, int pollTimeoutMs)
    : m_directory(std::move(directory)), m_pollTimeoutMs(pollTimeoutMs) {}

InotifyWatcher::~InotifyWatcher() {
    stop();
}

domain::Status InotifyWatcher::start(Callback onCreated) {
    if (m_running.load()) return domain::Status::Ok();

    m_inotifyFd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (m_inotifyFd < 0) {
        return domain::Status::Fail(domain::ErrorKind::Access,
                                    std::string("inotify_init1() failed: ") + strerror(errno));
    }

    m_watchDescriptor = inotify_add_watch(m_inotifyFd, m_directory.c_str(),
                                          IN_CREATE | IN_CLOSE_WRITE | IN_MOVED_TO | IN_ONLYDIR);
    if (m_watchDescriptor < 0) {
        std::string reason = strerror(errno);
        close(m_inotifyFd);
        m_inotifyFd = -1;
        return domain::Status::Fail(domain::ErrorKind::Access, "cannot watch " + m_directory + ": " + reason);
    }

    m_callback = std::move(onCreated);
    m_running = true;
    m_thread = std::thread(&InotifyWatcher::watchLoop, this);
    std::cout << "[InotifyWatcher] Watching " << m_directory << std::endl;
    return domain::Status::Ok();
}

void InotifyWatcher::stop() {
    m_running = false;
    if (m_thread.joinable()) {
        m_thread.join();
    }
    if (m_inotifyFd >= 0) {
        if (m_watchDescriptor >= 0) {
            inotify_rm_watch(m_inotifyFd, m_watchDescriptor);
            m_watchDescriptor = -1;
        }
        close(m_inotifyFd);
        m_inotifyFd = -1;
        std::cout << "[InotifyWatcher] Stopped watching " << m_directory << std::endl;
    }
}

std::optional<std::string> InotifyWatcher::handleEvent(uint32_t mask, const std::string& name) {
    if (name.empty()) return std::nullopt;
    const std::string fullPath = m_directory + "/" + name;

    std::lock_guard<std::mutex> lock(m_pendingMutex);
    if (mask & IN_ISDIR) {
        return (mask & (IN_CREATE | IN_MOVED_TO)) ? std::optional<std::string>(fullPath) : std::nullopt;
    }
    if (mask & IN_MOVED_TO) {
        m_pending.erase(name);
        return fullPath;
    }
    if (mask & IN_CREATE) {
        m_pending.insert(name);
        return std::nullopt;
    }
    if (mask & IN_CLOSE_WRITE) {
        if (m_pending.erase(name) > 0) return fullPath;
    }
    return std::nullopt;
}

void InotifyWatcher::watchLoop() {
    alignas(struct inotify_event) char buffer[4096];

    while (m_running.load()) {
        struct pollfd pfd;
        pfd.fd = m_inotifyFd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int pollResult = poll(&pfd, 1, m_pollTimeoutMs);
        if (pollResult < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[InotifyWatcher] poll() failed: " << strerror(errno) << std::endl;
            break;
        }
        if (pollResult == 0) continue;

        ssize_t length = read(m_inotifyFd, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            std::cerr << "[InotifyWatcher] read() failed: " << strerror(errno) << std::endl;
            break;
        }

        for (char* ptr = buffer; ptr < buffer + length;) {
            auto* event = reinterpret_cast<struct inotify_event*>(ptr);
            ptr += sizeof(struct inotify_event) + event->len;

            if (event->mask & IN_Q_OVERFLOW) {
                std::cerr << "[InotifyWatcher] Event queue overflow; some creations may be missed until the next scan."
                          << std::endl;
                continue;
            }
            if (event->mask & IN_IGNORED) {
                std::cerr << "[InotifyWatcher] Watch on " << m_directory << " was removed." << std::endl;
                m_running = false;
                break;
            }

            std::string name = event->len > 0 ? std::string(event->name) : std::string();
            auto path = handleEvent(event->mask, name);
            if (path && m_callback) {
                m_callback(*path);
            }
        }
    }
    m_running = false;
}

} // namespace vaultbreakdown::infrastructure
