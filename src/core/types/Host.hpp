/**
 * @file Host.hpp
 * @brief Monitored host state and status types.
 *
 * This file defines the HostState structure which holds the reachability
 * state and failure history tracked for each configured host.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace hostwatch::core {

/**
 * @brief Current reachability status of a monitored host.
 */
enum class HostStatus : int {
    Up = 0,  ///< Host accepted a TCP connection on the last check
    Down = 1 ///< Host could not be reached
};

/**
 * @brief Mutable monitoring state of a single host.
 *
 * One instance exists per configured hostname. A host starts UP with no
 * failures and no alert history.
 */
struct HostState {
    std::string name;   ///< Hostname or address, unique within the registry
    bool up{true};      ///< Current reachability state
    int failCount{0};   ///< Consecutive failed checks in the current period
    std::optional<std::chrono::system_clock::time_point> lastAlertAt; ///< Last CRITICAL alert sent

    /**
     * @brief Returns the status enum matching the up flag.
     * @return HostStatus::Up or HostStatus::Down.
     */
    [[nodiscard]] HostStatus status() const { return up ? HostStatus::Up : HostStatus::Down; }

    /**
     * @brief Converts the host status to the form used in reports.
     * @return "UP" or "DOWN".
     */
    [[nodiscard]] std::string statusToString() const;

    /**
     * @brief Checks the up/fail-count invariant.
     * @return False if the host is up while still carrying failures.
     */
    [[nodiscard]] bool isConsistent() const;

    bool operator==(const HostState& other) const = default;
};

} // namespace hostwatch::core
