/**
 * @file DailyTime.hpp
 * @brief Wall-clock time of day used to schedule the daily report.
 */

#pragma once

#include <chrono>
#include <string>

namespace hostwatch::core {

/**
 * @brief A local wall-clock time of day with minute resolution.
 */
struct DailyTime {
    int hour{0};   ///< Hour of day, 0-23
    int minute{0}; ///< Minute of hour, 0-59

    /**
     * @brief Parses an "HH:mm" string.
     * @param text Two-digit hour, colon, two-digit minute (e.g. "07:30").
     * @return The parsed time of day.
     * @throws ConfigurationError if the text is malformed or out of range.
     */
    static DailyTime parse(const std::string& text);

    /**
     * @brief Formats the time as "HH:mm".
     * @return Zero-padded string representation.
     */
    [[nodiscard]] std::string toString() const;

    /**
     * @brief Computes the next local occurrence of this time of day.
     *
     * Returns today's occurrence unless it is already in the past, in which
     * case tomorrow's occurrence is returned. An occurrence exactly equal to
     * @p now counts as today.
     *
     * @param now Reference instant.
     * @return The instant of the next occurrence.
     */
    [[nodiscard]] std::chrono::system_clock::time_point
    nextOccurrence(std::chrono::system_clock::time_point now) const;

    /**
     * @brief Computes the delay from @p now until the next occurrence.
     * @param now Reference instant.
     * @return Non-negative delay in milliseconds.
     */
    [[nodiscard]] std::chrono::milliseconds
    delayUntilNext(std::chrono::system_clock::time_point now) const;

    bool operator==(const DailyTime& other) const = default;
};

} // namespace hostwatch::core
