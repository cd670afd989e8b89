#include "monitor/MessageFormatter.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace hostwatch::monitor {

namespace {

std::string formatLocal(std::chrono::system_clock::time_point tp, const char* pattern) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, pattern);
    return oss.str();
}

} // namespace

MessageFormatter::MessageFormatter(std::vector<std::string> recipients)
    : recipients_(std::move(recipients)) {}

core::EmailMessage MessageFormatter::formatAlert(const core::Alert& alert) const {
    switch (alert.type) {
    case core::AlertType::HostDown:
        return formatCritical(alert);
    case core::AlertType::HostRecovered:
        return formatRecovery(alert);
    }
    return formatCritical(alert);
}

core::EmailMessage MessageFormatter::formatCritical(const core::Alert& alert) const {
    core::EmailMessage message;
    message.recipients = recipients_;
    message.subject = "CRITICAL: Host " + alert.hostName + " is DOWN";

    std::ostringstream body;
    body << "Host Monitor Alert - CRITICAL\n\n";
    body << "The following host is currently unreachable:\n";
    body << "Host: " << alert.hostName << "\n";
    body << "Time: " << formatTimestamp(alert.timestamp) << "\n";
    body << "Failure count: " << alert.failCount << "\n\n";
    body << "Please check the host immediately.\n";
    message.body = body.str();

    return message;
}

core::EmailMessage MessageFormatter::formatRecovery(const core::Alert& alert) const {
    core::EmailMessage message;
    message.recipients = recipients_;
    message.subject = "RECOVERED: Host " + alert.hostName + " is back online";

    std::ostringstream body;
    body << "Host Monitor Alert - RECOVERY\n\n";
    body << "The following host has recovered and is now reachable:\n";
    body << "Host: " << alert.hostName << "\n";
    body << "Time: " << formatTimestamp(alert.timestamp) << "\n";
    body << "Total failures: " << alert.failCount << "\n";
    message.body = body.str();

    return message;
}

core::EmailMessage
MessageFormatter::formatSummary(const std::vector<core::HostState>& hosts,
                                std::chrono::system_clock::time_point reportTime) const {
    size_t upCount = 0;
    for (const auto& host : hosts) {
        if (host.up) {
            ++upCount;
        }
    }
    size_t downCount = hosts.size() - upCount;

    core::EmailMessage message;
    message.recipients = recipients_;
    message.subject = "Daily Host Status Report - " + formatDate(reportTime);

    std::ostringstream body;
    body << "Host Monitor - Daily Status Report\n\n";
    body << "Report Time: " << formatTimestamp(reportTime) << "\n\n";
    body << "Host Status Summary:\n";
    body << "Total: " << hosts.size() << ", UP: " << upCount << ", DOWN: " << downCount << "\n";
    body << "Total hosts monitored: " << hosts.size() << "\n";
    body << "Hosts UP: " << upCount << "\n";
    body << "Hosts DOWN: " << downCount << "\n\n";

    body << "Detailed Status:\n";
    for (const auto& host : hosts) {
        body << host.name << ": ";
        if (host.up) {
            body << "UP - Failures in last period: " << host.failCount;
        } else {
            body << "DOWN - Current failure count: " << host.failCount;
        }
        body << "\n";
    }

    body << "\n\nThis is an automated report from Host Monitor.";
    message.body = body.str();

    return message;
}

std::string MessageFormatter::formatTimestamp(std::chrono::system_clock::time_point tp) {
    return formatLocal(tp, "%Y-%m-%d %H:%M:%S");
}

std::string MessageFormatter::formatDate(std::chrono::system_clock::time_point tp) {
    return formatLocal(tp, "%Y-%m-%d");
}

} // namespace hostwatch::monitor
