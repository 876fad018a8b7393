/**
 * @file WatchStateStore.hpp
 * @brief File-backed implementation of the WatchStateRepository.
 */

#pragma once
#include "domain/WatchStateRepository.hpp"
#include <string>

namespace vaultbreakdown::infrastructure {

/**
 * @class WatchStateStore
 * @brief Keeps last_run.txt and processed_files.json in a state directory.
 */
class WatchStateStore : public domain::WatchStateRepository {
public:
    static constexpr const char* kLastRunFile = "last_run.txt";
    static constexpr const char* kProcessedFile = "processed_files.json";

    /**
     * @param stateDir Directory holding the two state files. Created on first save.
     */
    explicit WatchStateStore(const std::string& stateDir);

    /** @brief Tolerates missing or corrupt files. @see domain::WatchStateRepository::load */
    domain::WatchState load() override;

    /** @brief Atomic rewrite of last_run.txt. */
    domain::Status saveLastRunTime(std::chrono::system_clock::time_point runTime) override;

    /** @brief Atomic rewrite of processed_files.json as a sorted JSON array. */
    domain::Status saveProcessedItems(const std::set<std::string>& items) override;

    const std::string& stateDir() const { return m_stateDir; }

private:
    std::string m_stateDir; ///< Directory of the state files.
};

} // namespace vaultbreakdown::infrastructure
