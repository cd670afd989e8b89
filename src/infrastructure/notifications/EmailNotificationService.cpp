#include "infrastructure/notifications/EmailNotificationService.hpp"

#include <QCoreApplication>
#include <QEventLoop>
#include <QMetaObject>
#include <QThread>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace hostwatch::infra {

using json = nlohmann::json;

namespace {

// Slack on top of the transfer timeout so the HTTP layer reports first.
constexpr std::chrono::milliseconds WAIT_GRACE{1000};

} // namespace

EmailNotificationService::EmailNotificationService(EmailSettings settings, QObject* parent)
    : QObject(parent), settings_(std::move(settings)) {
    httpClient_ = std::make_unique<HttpClient>(this);
}

void EmailNotificationService::setEnabled(bool enabled) {
    enabled_ = enabled;
}

bool EmailNotificationService::isEnabled() const {
    return enabled_;
}

bool EmailNotificationService::isConfigured() const {
    return !settings_.apiKey.empty() && !settings_.fromAddress.empty();
}

core::NotificationStatus EmailNotificationService::send(const core::EmailMessage& message) {
    core::NotificationStatus status;
    status.result = core::NotificationResult::Skipped;

    if (!enabled_) {
        spdlog::info("Notifications disabled, not sending '{}' to {} recipient(s):\n{}",
                     message.subject, message.recipients.size(), message.body);
        return status;
    }

    if (settings_.apiKey.empty()) {
        status.errorMessage = "SendGrid API key not configured";
        spdlog::error("{}", status.errorMessage);
        return status;
    }

    if (settings_.fromAddress.empty() || message.recipients.empty()) {
        status.errorMessage = "Email from/to addresses not configured";
        spdlog::error("{}", status.errorMessage);
        return status;
    }

    std::string payload = buildPayload(message);
    spdlog::debug("Sending email '{}' to {} recipient(s)", message.subject,
                  message.recipients.size());

    if (QThread::currentThread() == thread()) {
        status = sendOnOwnerThread(payload);
    } else {
        status = sendFromWorkerThread(payload);
    }

    if (status.succeeded()) {
        spdlog::info("Email sent successfully. Status code: {}", status.httpStatus);
    } else {
        spdlog::warn("Failed to send email. Result: {}, status code: {}, error: {}",
                     status.resultToString(), status.httpStatus, status.errorMessage);
    }
    return status;
}

core::NotificationStatus EmailNotificationService::sendOnOwnerThread(const std::string& payload) {
    // Shared so a reply arriving after the timeout has somewhere to go.
    struct Pending {
        core::NotificationStatus status;
        bool completed{false};
    };
    auto pending = std::make_shared<Pending>();

    httpClient_->post(makeRequest(payload), [pending](const HttpResponse& response) {
        pending->status = toStatus(response);
        pending->completed = true;
    });

    auto start = std::chrono::steady_clock::now();
    auto limit = std::chrono::milliseconds(settings_.timeoutMs) + WAIT_GRACE;
    while (!pending->completed) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 100);
        if (std::chrono::steady_clock::now() - start > limit) {
            core::NotificationStatus status;
            status.result = core::NotificationResult::TimedOut;
            status.errorMessage = "No response within " + std::to_string(settings_.timeoutMs) + " ms";
            return status;
        }
    }

    return pending->status;
}

core::NotificationStatus
EmailNotificationService::sendFromWorkerThread(const std::string& payload) {
    // Shared with the call queued on the owner thread, which may run after we give up.
    struct Handoff {
        enum class Stage { Queued, Posted, Abandoned };

        std::mutex mutex;
        std::condition_variable done;
        Stage stage{Stage::Queued};
        std::optional<core::NotificationStatus> status;
    };
    auto handoff = std::make_shared<Handoff>();

    bool queued = QMetaObject::invokeMethod(
        this,
        [this, payload, handoff]() {
            {
                std::lock_guard lock(handoff->mutex);
                if (handoff->stage == Handoff::Stage::Abandoned) {
                    spdlog::debug("Dropping e-mail request whose sender stopped waiting");
                    return;
                }
                handoff->stage = Handoff::Stage::Posted;
            }
            httpClient_->post(makeRequest(payload), [handoff](const HttpResponse& response) {
                std::lock_guard lock(handoff->mutex);
                handoff->status = toStatus(response);
                handoff->done.notify_all();
            });
        },
        Qt::QueuedConnection);

    core::NotificationStatus status;
    if (!queued) {
        status.errorMessage = "Failed to queue request on the network thread";
        return status;
    }

    auto limit = std::chrono::milliseconds(settings_.timeoutMs) + WAIT_GRACE;
    auto hasStatus = [&handoff] { return handoff->status.has_value(); };

    std::unique_lock lock(handoff->mutex);
    if (!handoff->done.wait_for(lock, limit, hasStatus)) {
        if (handoff->stage == Handoff::Stage::Queued) {
            handoff->stage = Handoff::Stage::Abandoned;
            status.result = core::NotificationResult::TimedOut;
            status.errorMessage = "Network thread busy for " + std::to_string(settings_.timeoutMs) +
                                  " ms; request not sent";
            return status;
        }
        // Already on the wire: the transfer timeout bounds the remaining wait.
        if (!handoff->done.wait_for(lock, limit, hasStatus)) {
            status.result = core::NotificationResult::TimedOut;
            status.errorMessage =
                "No response within " + std::to_string(settings_.timeoutMs) + " ms";
            return status;
        }
    }

    return *handoff->status;
}

std::string EmailNotificationService::buildPayload(const core::EmailMessage& message) const {
    json payload;

    json personalizations = json::array();
    for (const auto& recipient : message.recipients) {
        json personalization;
        personalization["to"] = json::array({json{{"email", recipient}}});
        personalizations.push_back(personalization);
    }
    payload["personalizations"] = personalizations;

    payload["from"]["email"] = settings_.fromAddress;
    if (!settings_.fromName.empty()) {
        payload["from"]["name"] = settings_.fromName;
    }

    payload["subject"] = message.subject;

    json content;
    content["type"] = "text/plain";
    content["value"] = message.body;
    payload["content"] = json::array({content});

    return payload.dump();
}

HttpRequest EmailNotificationService::makeRequest(const std::string& payload) const {
    HttpRequest request;
    request.url = settings_.endpoint;
    request.body = payload;
    request.headers = {
        {"Authorization", "Bearer " + settings_.apiKey},
        {"Content-Type", "application/json"},
    };
    request.timeoutMs = settings_.timeoutMs;
    return request;
}

core::NotificationStatus EmailNotificationService::toStatus(const HttpResponse& response) {
    core::NotificationStatus status;
    status.httpStatus = response.statusCode;

    if (response.success) {
        status.result = core::NotificationResult::Success;
    } else if (response.timedOut) {
        status.result = core::NotificationResult::TimedOut;
        status.errorMessage = response.errorMessage;
    } else {
        status.result = core::NotificationResult::Failed;
        status.errorMessage = response.errorMessage;
        if (!response.body.empty()) {
            status.errorMessage += " - " + response.body;
        }
    }
    return status;
}

} // namespace hostwatch::infra
