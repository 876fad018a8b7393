/**
 * @file WatchState.hpp
 * @brief Durable record of what the watcher has already handled.
 */

#pragma once
#include <chrono>
#include <set>
#include <string>

namespace vaultbreakdown::domain {

/**
 * @struct WatchState
 * @brief Last scan time and the set of processed items (resolved absolute paths).
 */
struct WatchState {
    std::chrono::system_clock::time_point lastRunTime{}; ///< Epoch when never run.
    std::set<std::string> processedItems;
};

} // namespace vaultbreakdown::domain
