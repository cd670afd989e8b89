#include "monitor/HostRegistry.hpp"

#include <spdlog/spdlog.h>

namespace hostwatch::monitor {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // namespace

HostRegistry::HostRegistry(const std::vector<std::string>& hostNames) {
    for (const auto& rawName : hostNames) {
        auto name = trim(rawName);
        if (name.empty()) {
            continue;
        }

        if (entries_.contains(name)) {
            spdlog::warn("Ignoring duplicate host in configuration: {}", name);
            continue;
        }

        auto entry = std::make_unique<Entry>();
        entry->state.name = name;
        entries_.emplace(name, std::move(entry));
        order_.push_back(name);

        spdlog::info("Added host to monitor: {}", name);
    }

    if (order_.empty()) {
        spdlog::warn("No hosts configured for monitoring");
    }
}

HostRegistry::Entry* HostRegistry::find(const std::string& host) const {
    auto it = entries_.find(host);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool HostRegistry::contains(const std::string& host) const {
    return entries_.contains(host);
}

std::optional<core::HostState> HostRegistry::get(const std::string& host) const {
    auto* entry = find(host);
    if (!entry) {
        return std::nullopt;
    }

    std::lock_guard lock(entry->mutex);
    return entry->state;
}

bool HostRegistry::setUp(const std::string& host, bool up) {
    return modify(host, [up](core::HostState& state) { state.up = up; });
}

std::optional<int> HostRegistry::incrementFail(const std::string& host) {
    int count = 0;
    if (!modify(host, [&count](core::HostState& state) { count = ++state.failCount; })) {
        return std::nullopt;
    }
    return count;
}

bool HostRegistry::resetFail(const std::string& host) {
    return modify(host, [](core::HostState& state) { state.failCount = 0; });
}

bool HostRegistry::recordAlertTime(const std::string& host,
                                   std::chrono::system_clock::time_point now) {
    return modify(host, [now](core::HostState& state) { state.lastAlertAt = now; });
}

bool HostRegistry::modify(const std::string& host,
                          const std::function<void(core::HostState&)>& fn) {
    auto* entry = find(host);
    if (!entry) {
        return false;
    }

    std::lock_guard lock(entry->mutex);
    fn(entry->state);
    return true;
}

void HostRegistry::resetAllFailCounts() {
    for (const auto& name : order_) {
        resetFail(name);
    }
    spdlog::debug("Reset failure counts for {} hosts", order_.size());
}

std::vector<core::HostState> HostRegistry::snapshot() const {
    std::vector<core::HostState> states;
    states.reserve(order_.size());
    for (const auto& name : order_) {
        auto* entry = find(name);
        std::lock_guard lock(entry->mutex);
        states.push_back(entry->state);
    }
    return states;
}

} // namespace hostwatch::monitor
