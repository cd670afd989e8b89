#pragma once

#include <chrono>
#include <string>

namespace hostwatch::core {

enum class AlertType : int { HostDown = 0, HostRecovered = 1 };

enum class AlertSeverity : int { Info = 0, Critical = 1 };

struct Alert {
    AlertType type{AlertType::HostDown};
    AlertSeverity severity{AlertSeverity::Critical};
    std::string hostName;
    int failCount{0};
    std::chrono::system_clock::time_point timestamp;

    [[nodiscard]] std::string typeToString() const;
    [[nodiscard]] std::string severityToString() const;

    static Alert hostDown(const std::string& hostName, int failCount,
                          std::chrono::system_clock::time_point timestamp);
    static Alert hostRecovered(const std::string& hostName, int failCount,
                               std::chrono::system_clock::time_point timestamp);

    bool operator==(const Alert& other) const = default;
};

} // namespace hostwatch::core
