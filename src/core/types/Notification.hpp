/**
 * @file Notification.hpp
 * @brief E-mail message and delivery status types.
 *
 * This file defines the message handed to the notification service and the
 * status it reports back.
 */

#pragma once

#include <string>
#include <vector>

namespace hostwatch::core {

/**
 * @brief A rendered plain-text message ready for delivery.
 */
struct EmailMessage {
    std::string subject;                 ///< Subject line
    std::string body;                    ///< Plain-text body
    std::vector<std::string> recipients; ///< Recipient addresses

    bool operator==(const EmailMessage& other) const = default;
};

/**
 * @brief Result of a notification delivery attempt.
 */
enum class NotificationResult {
    Success,  ///< Provider accepted the message
    Failed,   ///< Provider rejected the message or the request failed
    Skipped,  ///< Not attempted (service disabled or not configured)
    TimedOut  ///< No answer within the configured timeout
};

/**
 * @brief Status of a notification delivery.
 */
struct NotificationStatus {
    NotificationResult result{NotificationResult::Failed}; ///< Delivery result
    int httpStatus{0};        ///< HTTP status code from the provider, 0 if none
    std::string errorMessage; ///< Error message if delivery failed

    /**
     * @brief Checks whether the message was delivered.
     * @return True only for NotificationResult::Success.
     */
    [[nodiscard]] bool succeeded() const { return result == NotificationResult::Success; }

    /**
     * @brief Converts the result to a string for logging.
     * @return "Success", "Failed", "Skipped" or "TimedOut".
     */
    [[nodiscard]] std::string resultToString() const;
};

} // namespace hostwatch::core
