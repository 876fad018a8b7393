/**
 * @file WatchStateRepository.hpp
 * @brief Interface for durable storage of the WatchState.
 */

#pragma once
#include <chrono>
#include <set>
#include <string>
#include "domain/Result.hpp"
#include "domain/WatchState.hpp"

namespace vaultbreakdown::domain {

/**
 * @class WatchStateRepository
 * @brief Abstract persistence for the change detector's state.
 */
class WatchStateRepository {
public:
    virtual ~WatchStateRepository() = default;

    /**
     * @brief Loads the persisted state.
     * Missing or corrupt data yields the "never run" state (epoch, empty set).
     */
    virtual WatchState load() = 0;

    /** @brief Persists the last scan time. */
    virtual Status saveLastRunTime(std::chrono::system_clock::time_point runTime) = 0;

    /** @brief Persists the full set of processed items. */
    virtual Status saveProcessedItems(const std::set<std::string>& items) = 0;
};

} // namespace vaultbreakdown::domain
