/**
 * @file INotificationService.hpp
 * @brief Interface for the outbound notification transport.
 *
 * This file defines the boundary between the monitor, which renders alert
 * and report messages, and the service that delivers them.
 */

#pragma once

#include "core/types/Notification.hpp"

namespace hostwatch::core {

/**
 * @brief Interface for delivering rendered messages to recipients.
 *
 * Delivery is attempted once. Failures are reported through the returned
 * status and never thrown.
 */
class INotificationService {
public:
    virtual ~INotificationService() = default;

    /**
     * @brief Delivers a message to its recipients.
     * @param message Subject, plain-text body and recipient list.
     * @return Delivery status; anything but Success is a non-fatal failure.
     */
    virtual NotificationStatus send(const EmailMessage& message) = 0;

    /**
     * @brief Enables or disables delivery.
     * @param enabled False turns every send into a Skipped result.
     */
    virtual void setEnabled(bool enabled) = 0;

    /**
     * @brief Checks if delivery is enabled.
     * @return True if messages are being delivered.
     */
    virtual bool isEnabled() const = 0;
};

} // namespace hostwatch::core
