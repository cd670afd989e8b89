#include "core/types/Notification.hpp"

namespace hostwatch::core {

std::string NotificationStatus::resultToString() const {
    switch (result) {
    case NotificationResult::Success:
        return "Success";
    case NotificationResult::Failed:
        return "Failed";
    case NotificationResult::Skipped:
        return "Skipped";
    case NotificationResult::TimedOut:
        return "TimedOut";
    }
    return "Unknown";
}

} // namespace hostwatch::core
