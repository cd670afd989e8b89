#include "core/types/Alert.hpp"

namespace hostwatch::core {

std::string Alert::typeToString() const {
    switch (type) {
    case AlertType::HostDown:
        return "HostDown";
    case AlertType::HostRecovered:
        return "HostRecovered";
    }
    return "Unknown";
}

std::string Alert::severityToString() const {
    switch (severity) {
    case AlertSeverity::Info:
        return "Info";
    case AlertSeverity::Critical:
        return "Critical";
    }
    return "Unknown";
}

Alert Alert::hostDown(const std::string& hostName, int failCount,
                      std::chrono::system_clock::time_point timestamp) {
    Alert alert;
    alert.type = AlertType::HostDown;
    alert.severity = AlertSeverity::Critical;
    alert.hostName = hostName;
    alert.failCount = failCount;
    alert.timestamp = timestamp;
    return alert;
}

Alert Alert::hostRecovered(const std::string& hostName, int failCount,
                           std::chrono::system_clock::time_point timestamp) {
    Alert alert;
    alert.type = AlertType::HostRecovered;
    alert.severity = AlertSeverity::Info;
    alert.hostName = hostName;
    alert.failCount = failCount;
    alert.timestamp = timestamp;
    return alert;
}

} // namespace hostwatch::core
