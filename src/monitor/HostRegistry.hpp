/**
 * @file HostRegistry.hpp
 * @brief Thread-safe store of per-host monitoring state.
 */

#pragma once

#include "core/types/Host.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hostwatch::monitor {

/**
 * @brief Holds the state of every configured host.
 *
 * The set of hosts is fixed at construction. Each host's state is guarded by
 * its own mutex, so operations on one host are atomic with respect to each
 * other while different hosts never contend. Multi-host reads are consistent
 * per host only.
 */
class HostRegistry {
public:
    /**
     * @brief Creates the registry from the configured host list.
     *
     * Names are trimmed, empty names are skipped and duplicates are ignored
     * with a warning. Every host starts UP with no failures.
     *
     * @param hostNames Hostnames in configuration order.
     */
    explicit HostRegistry(const std::vector<std::string>& hostNames);

    HostRegistry(const HostRegistry&) = delete;
    HostRegistry& operator=(const HostRegistry&) = delete;

    /**
     * @brief Checks if a host is registered.
     * @param host Hostname to look up.
     * @return True if the host is monitored.
     */
    [[nodiscard]] bool contains(const std::string& host) const;

    /**
     * @brief Reads the current state of a host.
     * @param host Hostname to look up.
     * @return Copy of the state, nullopt if the host is unknown.
     */
    [[nodiscard]] std::optional<core::HostState> get(const std::string& host) const;

    /**
     * @brief Sets the up flag of a host.
     * @return False if the host is unknown.
     */
    bool setUp(const std::string& host, bool up);

    /**
     * @brief Increments the consecutive failure counter of a host.
     * @return The new count, nullopt if the host is unknown.
     */
    std::optional<int> incrementFail(const std::string& host);

    /**
     * @brief Resets the failure counter of a host to zero.
     * @return False if the host is unknown.
     */
    bool resetFail(const std::string& host);

    /**
     * @brief Records the time a CRITICAL alert was sent for a host.
     * @return False if the host is unknown.
     */
    bool recordAlertTime(const std::string& host, std::chrono::system_clock::time_point now);

    /**
     * @brief Applies a read-modify-write transition to one host atomically.
     *
     * @p fn runs with the host's lock held and must not call back into the
     * registry for the same host.
     *
     * @param host Hostname to modify.
     * @param fn Function receiving a mutable reference to the state.
     * @return False if the host is unknown (fn is not called).
     */
    bool modify(const std::string& host, const std::function<void(core::HostState&)>& fn);

    /**
     * @brief Resets the failure counter of every host; up/down is untouched.
     */
    void resetAllFailCounts();

    /**
     * @brief Returns the monitored hostnames in configuration order.
     */
    [[nodiscard]] std::vector<std::string> hostNames() const { return order_; }

    /**
     * @brief Copies the state of every host, each read under its own lock.
     * @return One state per host in configuration order.
     */
    [[nodiscard]] std::vector<core::HostState> snapshot() const;

    [[nodiscard]] size_t size() const { return order_.size(); }
    [[nodiscard]] bool empty() const { return order_.empty(); }

private:
    struct Entry {
        core::HostState state;
        mutable std::mutex mutex;
    };

    Entry* find(const std::string& host) const;

    std::map<std::string, std::unique_ptr<Entry>> entries_;
    std::vector<std::string> order_;
};

} // namespace hostwatch::monitor
