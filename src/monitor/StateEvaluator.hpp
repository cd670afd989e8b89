/**
 * @file StateEvaluator.hpp
 * @brief Up/down transition rules and alert throttling.
 *
 * This file defines the pure state machine that turns a probe outcome and
 * the current host state into the next state and an alert decision.
 */

#pragma once

#include "core/types/Alert.hpp"
#include "core/types/Host.hpp"

#include <chrono>
#include <optional>

namespace hostwatch::monitor {

/**
 * @brief Kind of state change produced by one evaluation.
 */
enum class Transition : int {
    None = 0,      ///< Host was up and is still reachable
    WentDown = 1,  ///< Host was up and the probe failed
    StillDown = 2, ///< Host was down and the probe failed again
    Recovered = 3  ///< Host was down and the probe succeeded
};

/**
 * @brief Outcome of evaluating one probe result for one host.
 */
struct Evaluation {
    core::HostState next;                 ///< State to store for the host
    Transition transition{Transition::None}; ///< Which table row applied
    std::optional<core::AlertType> alert; ///< Alert to send, if any
    int alertFailCount{0};                ///< Failure count the alert must report

    [[nodiscard]] bool hasAlert() const { return alert.has_value(); }
};

/**
 * @brief Computes host transitions and decides when alerts are due.
 *
 * A host is either UP or DOWN. Going down or staying down increments the
 * failure count and raises a CRITICAL alert only when no CRITICAL alert was
 * sent within the throttle window. Recovery resets the failure count and
 * always raises a RECOVERY alert.
 */
class StateEvaluator {
public:
    /**
     * @brief Constructs an evaluator.
     * @param throttleWindow Minimum time between two CRITICAL alerts for a host.
     */
    explicit StateEvaluator(std::chrono::milliseconds throttleWindow);

    /**
     * @brief Applies one probe result to a host state.
     * @param current State before the probe.
     * @param reachable Probe outcome.
     * @param now Time of the evaluation.
     * @return Next state, transition and alert decision.
     */
    [[nodiscard]] Evaluation evaluate(const core::HostState& current, bool reachable,
                                      std::chrono::system_clock::time_point now) const;

    /**
     * @brief Forces a host down for operational testing.
     *
     * Always raises a CRITICAL alert regardless of the throttle window and
     * records @p now as the last alert time. The failure count is unchanged.
     */
    [[nodiscard]] Evaluation forceDown(const core::HostState& current,
                                       std::chrono::system_clock::time_point now) const;

    /**
     * @brief Checks whether a CRITICAL alert may be sent now.
     * @return True if no alert was sent yet or the window has strictly elapsed.
     */
    [[nodiscard]] bool alertAllowed(const core::HostState& state,
                                    std::chrono::system_clock::time_point now) const;

    [[nodiscard]] std::chrono::milliseconds throttleWindow() const { return throttleWindow_; }

    static std::string transitionToString(Transition transition);

private:
    std::chrono::milliseconds throttleWindow_;
};

} // namespace hostwatch::monitor
