/**
 * @file TimeUtils.hpp
 * @brief Timestamp formatting and parsing shared by state files and front-matter.
 */

#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace vaultbreakdown::infrastructure {

class TimeUtils {
public:
    /** @brief "YYYY-MM-DDTHH:MM:SS.ffffff+00:00" in UTC. */
    static std::string ToIso8601Utc(std::chrono::system_clock::time_point tp);

    /**
     * @brief Parses ISO-8601 with optional fractional seconds and a "Z" or ±HH:MM offset.
     * @return nullopt on malformed input.
     */
    static std::optional<std::chrono::system_clock::time_point> ParseIso8601(const std::string& text);

    /** @brief Local calendar date "YYYY-MM-DD" used in note front-matter. */
    static std::string TodayLocalDate();

    /** @brief Converts a file clock time point to the system clock. */
    static std::chrono::system_clock::time_point FromFileTime(std::filesystem::file_time_type ftime);
};

} // namespace vaultbreakdown::infrastructure
