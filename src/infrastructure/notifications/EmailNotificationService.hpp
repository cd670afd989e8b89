#pragma once

#include "core/services/INotificationService.hpp"
#include "infrastructure/notifications/HttpClient.hpp"

#include <QObject>
#include <atomic>
#include <memory>
#include <string>

namespace hostwatch::infra {

/**
 * @brief Sender identity and transport settings for e-mail delivery.
 */
struct EmailSettings {
    std::string apiKey;                                          ///< SendGrid API key.
    std::string fromAddress;                                     ///< Sender address.
    std::string fromName{"Host Monitor"};                        ///< Sender display name.
    std::string endpoint{"https://api.sendgrid.com/v3/mail/send"}; ///< Mail-send endpoint.
    int timeoutMs{10000};                                        ///< Upper bound for one delivery.
};

/**
 * @brief Delivers plain-text e-mails through the SendGrid v3 mail-send API.
 *
 * Implements core::INotificationService. Each message is posted once; there
 * is no retry. send() may be called from any thread: calls from other
 * threads are queued onto the thread that owns this object and waited on
 * for at most the configured timeout, which requires that thread to run a
 * Qt event loop. A queued request that has not been posted by then is
 * dropped and reported TimedOut.
 */
class EmailNotificationService : public QObject, public core::INotificationService {
    Q_OBJECT

public:
    /**
     * @brief Constructs an EmailNotificationService.
     * @param settings API key, sender and transport settings.
     * @param parent Optional parent QObject for memory management.
     */
    explicit EmailNotificationService(EmailSettings settings, QObject* parent = nullptr);

    ~EmailNotificationService() override = default;

    /**
     * @brief Sends a message to its recipients.
     * @param message Subject, body and recipients.
     * @return Success on a 2xx answer; Skipped when disabled or not configured;
     *         TimedOut when no answer arrived in time; Failed otherwise.
     */
    core::NotificationStatus send(const core::EmailMessage& message) override;

    void setEnabled(bool enabled) override;
    bool isEnabled() const override;

    /**
     * @brief Builds the SendGrid JSON request body for a message.
     * @param message Message to encode.
     * @return Serialized JSON payload.
     */
    std::string buildPayload(const core::EmailMessage& message) const;

    /**
     * @brief Checks whether the sender and API key are configured.
     */
    [[nodiscard]] bool isConfigured() const;

    [[nodiscard]] const EmailSettings& settings() const { return settings_; }

private:
    core::NotificationStatus sendOnOwnerThread(const std::string& payload);
    core::NotificationStatus sendFromWorkerThread(const std::string& payload);

    HttpRequest makeRequest(const std::string& payload) const;
    static core::NotificationStatus toStatus(const HttpResponse& response);

    EmailSettings settings_;
    std::unique_ptr<HttpClient> httpClient_;
    std::atomic<bool> enabled_{true};
};

} // namespace hostwatch::infra
