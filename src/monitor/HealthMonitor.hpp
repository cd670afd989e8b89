/**
 * @file HealthMonitor.hpp
 * @brief Check cycle, report cycle and manual triggers.
 *
 * This file defines the HealthMonitor class which ties the prober, the host
 * registry, the state evaluator and the notification service together.
 */

#pragma once

#include "core/services/INotificationService.hpp"
#include "core/services/IProber.hpp"
#include "core/types/Alert.hpp"
#include "monitor/HostRegistry.hpp"
#include "monitor/MessageFormatter.hpp"
#include "monitor/StateEvaluator.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace hostwatch::monitor {

/**
 * @brief Probe parameters and alert policy used by every check.
 */
struct MonitorSettings {
    uint16_t port{80};                                ///< TCP port probed on every host
    std::chrono::milliseconds probeTimeout{2000};     ///< Timeout per connection attempt
    int probeRetries{3};                              ///< Attempts per probe
    std::chrono::milliseconds throttleWindow{std::chrono::minutes(30)}; ///< Minimum gap between CRITICAL alerts
};

/**
 * @brief Totals for one completed check cycle.
 */
struct CheckSummary {
    int hostsChecked{0}; ///< Hosts processed without an error
    int hostsUp{0};      ///< Hosts UP after the cycle
    int hostsDown{0};    ///< Hosts DOWN after the cycle
    int alertsSent{0};   ///< Alerts handed to the notification service
    int errors{0};       ///< Hosts whose processing raised an error
};

/**
 * @brief Runs the monitoring cycles against a shared HostRegistry.
 *
 * Each host is processed independently: an error while probing or notifying
 * one host is logged and the cycle moves on. Per-host state changes are
 * applied atomically through HostRegistry::modify, so scheduled cycles and
 * manual triggers may run concurrently.
 */
class HealthMonitor {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @brief Constructs a HealthMonitor.
     * @param registry Host state store, owned by the caller.
     * @param prober Reachability probe implementation.
     * @param notifier Notification transport.
     * @param formatter Message renderer carrying the recipient list.
     * @param settings Probe parameters and throttle window.
     * @param clock Time source; defaults to the system clock.
     */
    HealthMonitor(HostRegistry& registry, std::shared_ptr<core::IProber> prober,
                  std::shared_ptr<core::INotificationService> notifier, MessageFormatter formatter,
                  MonitorSettings settings, Clock clock = nullptr);

    /**
     * @brief Probes every host once and applies the results.
     * @return Totals for the cycle.
     */
    CheckSummary checkHosts();

    /**
     * @brief Probes one host and applies the result.
     * @param host Hostname to check.
     * @return True if an alert was dispatched for the host.
     */
    bool checkHost(const std::string& host);

    /**
     * @brief Sends the status summary and resets every failure count.
     *
     * Failure counts are reset even if delivery fails. Up/down state is not
     * modified.
     *
     * @return Delivery status of the summary.
     */
    core::NotificationStatus sendDailyReport();

    /**
     * @brief Forces a host DOWN and sends a CRITICAL alert, ignoring the throttle.
     * @param host Hostname to mark down.
     * @return False if the host is not monitored (nothing changes).
     */
    bool simulateHostDown(const std::string& host);

    [[nodiscard]] const MonitorSettings& settings() const { return settings_; }
    [[nodiscard]] HostRegistry& registry() { return registry_; }

private:
    core::NotificationStatus dispatch(const core::Alert& alert);
    core::NotificationStatus deliver(const core::EmailMessage& message);

    HostRegistry& registry_;
    std::shared_ptr<core::IProber> prober_;
    std::shared_ptr<core::INotificationService> notifier_;
    MessageFormatter formatter_;
    MonitorSettings settings_;
    StateEvaluator evaluator_;
    Clock clock_;
};

} // namespace hostwatch::monitor
