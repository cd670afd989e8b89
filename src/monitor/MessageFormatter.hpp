/**
 * @file MessageFormatter.hpp
 * @brief Renders alert and report e-mails as plain text.
 */

#pragma once

#include "core/types/Alert.hpp"
#include "core/types/Host.hpp"
#include "core/types/Notification.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace hostwatch::monitor {

/**
 * @brief Builds the subject and body of every outgoing message.
 */
class MessageFormatter {
public:
    /**
     * @brief Constructs a formatter.
     * @param recipients Addresses attached to every rendered message.
     */
    explicit MessageFormatter(std::vector<std::string> recipients);

    /**
     * @brief Renders a CRITICAL or RECOVERY alert depending on its type.
     */
    [[nodiscard]] core::EmailMessage formatAlert(const core::Alert& alert) const;

    [[nodiscard]] core::EmailMessage formatCritical(const core::Alert& alert) const;
    [[nodiscard]] core::EmailMessage formatRecovery(const core::Alert& alert) const;

    /**
     * @brief Renders the periodic status summary.
     * @param hosts Per-host states in report order.
     * @param reportTime Time the report was generated.
     */
    [[nodiscard]] core::EmailMessage
    formatSummary(const std::vector<core::HostState>& hosts,
                  std::chrono::system_clock::time_point reportTime) const;

    /**
     * @brief Formats a time point as local "YYYY-MM-DD HH:MM:SS".
     */
    static std::string formatTimestamp(std::chrono::system_clock::time_point tp);

    /**
     * @brief Formats the local calendar date of a time point as "YYYY-MM-DD".
     */
    static std::string formatDate(std::chrono::system_clock::time_point tp);

    [[nodiscard]] const std::vector<std::string>& recipients() const { return recipients_; }

private:
    std::vector<std::string> recipients_;
};

} // namespace hostwatch::monitor
