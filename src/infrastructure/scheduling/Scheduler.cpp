#include "infrastructure/scheduling/Scheduler.hpp"

#include <spdlog/spdlog.h>

namespace hostwatch::infra {

Scheduler::Scheduler(AsioContext& context) : context_(context) {
    spdlog::debug("Scheduler initialized");
}

Scheduler::~Scheduler() {
    stop();
    if (context_.isRunning()) {
        std::unique_lock lock(mutex_);
        idle_.wait(lock, [this] { return outstanding_ == 0; });
    }
}

bool Scheduler::addTask(const std::string& name, std::chrono::milliseconds initialDelay,
                        std::chrono::milliseconds interval, Action action) {
    if (interval.count() <= 0) {
        spdlog::error("Rejecting task {}: interval must be positive", name);
        return false;
    }

    std::lock_guard lock(mutex_);

    if (tasks_.contains(name)) {
        spdlog::warn("Task already scheduled: {}", name);
        return false;
    }

    auto item = std::make_shared<ScheduledItem>();
    item->name = name;
    item->initialDelay = initialDelay.count() > 0 ? initialDelay : std::chrono::milliseconds(0);
    item->interval = interval;
    item->action = std::move(action);
    item->timer = std::make_shared<asio::steady_timer>(context_.getContext());

    tasks_[name] = item;

    spdlog::info("Scheduled task {}: first run in {}s, then every {}s", name,
                 std::chrono::duration_cast<std::chrono::seconds>(item->initialDelay).count(),
                 std::chrono::duration_cast<std::chrono::seconds>(interval).count());

    if (running_) {
        item->active = true;
        arm(item, std::chrono::steady_clock::now() + item->initialDelay);
    }
    return true;
}

void Scheduler::start() {
    if (running_.exchange(true)) {
        return;
    }

    std::lock_guard lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    for (auto& [name, item] : tasks_) {
        item->active = true;
        arm(item, now + item->initialDelay);
    }

    spdlog::info("Scheduler started with {} tasks", tasks_.size());
}

void Scheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    std::lock_guard lock(mutex_);
    for (auto& [name, item] : tasks_) {
        item->active = false;
        item->timer->cancel();
    }

    spdlog::info("Scheduler stopped");
}

bool Scheduler::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idle_.wait_for(lock, timeout, [this] { return outstanding_ == 0; });
}

std::vector<std::string> Scheduler::taskNames() const {
    std::lock_guard lock(mutex_);

    std::vector<std::string> names;
    names.reserve(tasks_.size());
    for (const auto& [name, item] : tasks_) {
        names.push_back(name);
    }
    return names;
}

std::optional<int> Scheduler::runCount(const std::string& name) const {
    std::lock_guard lock(mutex_);

    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second->runs.load();
}

std::optional<int> Scheduler::skippedCount(const std::string& name) const {
    std::lock_guard lock(mutex_);

    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second->skipped.load();
}

void Scheduler::arm(std::shared_ptr<ScheduledItem> item,
                    std::chrono::steady_clock::time_point deadline) {
    if (!item->active || !running_) {
        return;
    }

    item->deadline = deadline;
    item->timer->expires_at(deadline);
    ++outstanding_;
    item->timer->async_wait(
        [this, item](const asio::error_code& ec) { onTimer(item, ec); });
}

void Scheduler::onTimer(const std::shared_ptr<ScheduledItem>& item, const asio::error_code& ec) {
    if (!ec && item->active && running_) {
        execute(item);
    }

    std::lock_guard lock(mutex_);
    if (!ec && item->active && running_) {
        arm(item, nextDeadline(*item));
    }
    --outstanding_;
    idle_.notify_all();
}

void Scheduler::execute(const std::shared_ptr<ScheduledItem>& item) {
    ++item->runs;
    spdlog::debug("Running task {} (run {})", item->name, item->runs.load());

    try {
        item->action();
    } catch (const std::exception& e) {
        spdlog::error("Task {} failed: {}", item->name, e.what());
    }
}

std::chrono::steady_clock::time_point Scheduler::nextDeadline(ScheduledItem& item) const {
    auto next = item.deadline + item.interval;
    auto now = std::chrono::steady_clock::now();

    if (next < now) {
        auto missed = static_cast<int>((now - next) / item.interval) + 1;
        next += item.interval * missed;
        item.skipped += missed;
        spdlog::warn("Task {} overran its interval, skipping {} run(s)", item.name, missed);
    }
    return next;
}

} // namespace hostwatch::infra
