#include "monitor/HealthMonitor.hpp"

#include <spdlog/spdlog.h>

namespace hostwatch::monitor {

HealthMonitor::HealthMonitor(HostRegistry& registry, std::shared_ptr<core::IProber> prober,
                             std::shared_ptr<core::INotificationService> notifier,
                             MessageFormatter formatter, MonitorSettings settings, Clock clock)
    : registry_(registry), prober_(std::move(prober)), notifier_(std::move(notifier)),
      formatter_(std::move(formatter)), settings_(settings),
      evaluator_(settings.throttleWindow), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

CheckSummary HealthMonitor::checkHosts() {
    spdlog::info("Checking host status via TCP...");

    CheckSummary summary;
    for (const auto& host : registry_.hostNames()) {
        try {
            if (checkHost(host)) {
                ++summary.alertsSent;
            }
            ++summary.hostsChecked;
        } catch (const std::exception& e) {
            ++summary.errors;
            spdlog::error("Check failed for host {}: {}", host, e.what());
        }
    }

    for (const auto& state : registry_.snapshot()) {
        if (state.up) {
            ++summary.hostsUp;
        } else {
            ++summary.hostsDown;
        }
    }

    spdlog::info("Check cycle complete: {} checked, {} up, {} down, {} alerts", summary.hostsChecked,
                 summary.hostsUp, summary.hostsDown, summary.alertsSent);
    return summary;
}

bool HealthMonitor::checkHost(const std::string& host) {
    bool reachable =
        prober_->probe(host, settings_.port, settings_.probeTimeout, settings_.probeRetries);
    auto now = clock_();

    Evaluation evaluation;
    bool known = registry_.modify(host, [&](core::HostState& state) {
        evaluation = evaluator_.evaluate(state, reachable, now);
        state = evaluation.next;
    });

    if (!known) {
        spdlog::warn("Cannot check host: host not found: {}", host);
        return false;
    }
    if (!evaluation.next.isConsistent()) {
        spdlog::error("Host {} left in inconsistent state: {} with failure count {}", host,
                      evaluation.next.statusToString(), evaluation.next.failCount);
    }

    switch (evaluation.transition) {
    case Transition::WentDown:
        spdlog::warn("Host {} is DOWN", host);
        break;
    case Transition::StillDown:
        spdlog::warn("Host {} still DOWN. Failure count: {}", host, evaluation.next.failCount);
        break;
    case Transition::Recovered:
        spdlog::info("Host {} recovered", host);
        break;
    case Transition::None:
        spdlog::debug("Host {} is UP", host);
        break;
    }

    if (!evaluation.alert) {
        if (evaluation.transition == Transition::WentDown ||
            evaluation.transition == Transition::StillDown) {
            spdlog::info("Alert for host {} throttled (last alert within {} minutes)", host,
                         std::chrono::duration_cast<std::chrono::minutes>(
                             settings_.throttleWindow)
                             .count());
        }
        return false;
    }

    core::Alert alert = *evaluation.alert == core::AlertType::HostRecovered
                            ? core::Alert::hostRecovered(host, evaluation.alertFailCount, now)
                            : core::Alert::hostDown(host, evaluation.alertFailCount, now);
    dispatch(alert);
    return true;
}

core::NotificationStatus HealthMonitor::sendDailyReport() {
    spdlog::info("Generating daily status report");

    auto now = clock_();
    auto message = formatter_.formatSummary(registry_.snapshot(), now);
    auto status = deliver(message);

    // Counters cover one reporting period regardless of delivery outcome.
    registry_.resetAllFailCounts();

    if (status.succeeded()) {
        spdlog::info("Daily status report sent successfully");
    } else {
        spdlog::warn("Daily status report not delivered ({})", status.resultToString());
    }
    return status;
}

bool HealthMonitor::simulateHostDown(const std::string& host) {
    auto now = clock_();

    Evaluation evaluation;
    bool known = registry_.modify(host, [&](core::HostState& state) {
        evaluation = evaluator_.forceDown(state, now);
        state = evaluation.next;
    });

    if (!known) {
        spdlog::warn("Cannot simulate down status: host not found: {}", host);
        return false;
    }

    dispatch(core::Alert::hostDown(host, evaluation.alertFailCount, now));
    spdlog::info("Simulated down status for host: {}", host);
    return true;
}

core::NotificationStatus HealthMonitor::dispatch(const core::Alert& alert) {
    auto status = deliver(formatter_.formatAlert(alert));
    if (status.succeeded()) {
        spdlog::info("Sent {} {} alert for host: {}", alert.severityToString(),
                     alert.typeToString(), alert.hostName);
    }
    return status;
}

core::NotificationStatus HealthMonitor::deliver(const core::EmailMessage& message) {
    core::NotificationStatus status;
    try {
        status = notifier_->send(message);
    } catch (const std::exception& e) {
        status.result = core::NotificationResult::Failed;
        status.errorMessage = e.what();
    }

    if (!status.succeeded()) {
        spdlog::warn("Notification '{}' not delivered: {} {}", message.subject,
                     status.resultToString(), status.errorMessage);
    }
    return status;
}

} // namespace hostwatch::monitor
