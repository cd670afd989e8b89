#include "monitor/StateEvaluator.hpp"

namespace hostwatch::monitor {

StateEvaluator::StateEvaluator(std::chrono::milliseconds throttleWindow)
    : throttleWindow_(throttleWindow) {}

bool StateEvaluator::alertAllowed(const core::HostState& state,
                                  std::chrono::system_clock::time_point now) const {
    if (!state.lastAlertAt) {
        return true;
    }
    return now - *state.lastAlertAt > throttleWindow_;
}

Evaluation StateEvaluator::evaluate(const core::HostState& current, bool reachable,
                                    std::chrono::system_clock::time_point now) const {
    Evaluation result;
    result.next = current;

    if (current.up && !reachable) {
        result.transition = Transition::WentDown;
        result.next.up = false;
        result.next.failCount = current.failCount + 1;
    } else if (!current.up && reachable) {
        result.transition = Transition::Recovered;
        result.next.up = true;
        result.next.failCount = 0;
        result.alert = core::AlertType::HostRecovered;
        result.alertFailCount = current.failCount;
        return result;
    } else if (!reachable) {
        result.transition = Transition::StillDown;
        result.next.failCount = current.failCount + 1;
    } else {
        return result;
    }

    // Both down rows share the throttle test.
    if (alertAllowed(current, now)) {
        result.alert = core::AlertType::HostDown;
        result.alertFailCount = result.next.failCount;
        result.next.lastAlertAt = now;
    }
    return result;
}

Evaluation StateEvaluator::forceDown(const core::HostState& current,
                                     std::chrono::system_clock::time_point now) const {
    Evaluation result;
    result.next = current;
    result.next.up = false;
    result.next.lastAlertAt = now;
    result.transition = current.up ? Transition::WentDown : Transition::StillDown;
    result.alert = core::AlertType::HostDown;
    result.alertFailCount = current.failCount;
    return result;
}

std::string StateEvaluator::transitionToString(Transition transition) {
    switch (transition) {
    case Transition::None:
        return "None";
    case Transition::WentDown:
        return "WentDown";
    case Transition::StillDown:
        return "StillDown";
    case Transition::Recovered:
        return "Recovered";
    }
    return "Unknown";
}

} // namespace hostwatch::monitor
