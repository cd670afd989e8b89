#pragma once

#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hostwatch::infra {

/**
 * @brief Runs named periodic tasks on an AsioContext.
 *
 * A task's timer is re-armed only after its action returns, so a task never
 * runs concurrently with itself. Different tasks run on different worker
 * threads and may overlap. Deadlines advance by a fixed interval from the
 * previous deadline; deadlines already in the past when a run finishes are
 * skipped rather than queued.
 *
 * The scheduler tracks every timer wait and run it has handed to the
 * context. Destroying it while the context is running blocks until those
 * handlers have finished, so a task must not destroy its own scheduler.
 */
class Scheduler {
public:
    using Action = std::function<void()>;

    /**
     * @brief Constructs a Scheduler.
     * @param context AsioContext whose worker threads execute the tasks.
     */
    explicit Scheduler(AsioContext& context);

    /**
     * @brief Destructor. Stops the scheduler and, if the context is running,
     * waits for handlers still in flight.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Registers a periodic task.
     *
     * If the scheduler is already running the task is armed immediately.
     *
     * @param name Unique task name used in logs.
     * @param initialDelay Delay before the first run.
     * @param interval Period between consecutive deadlines (must be positive).
     * @param action Work to execute. Exceptions are logged and do not stop the task.
     * @return False if the name is taken or the interval is not positive.
     */
    bool addTask(const std::string& name, std::chrono::milliseconds initialDelay,
                 std::chrono::milliseconds interval, Action action);

    /**
     * @brief Arms every registered task.
     */
    void start();

    /**
     * @brief Cancels every pending timer. A run in progress completes.
     */
    void stop();

    /**
     * @brief Waits until no timer wait or run of this scheduler is in flight.
     *
     * Cancelled waits only drain while the context is running.
     *
     * @param timeout Upper bound for the wait.
     * @return True if the scheduler went idle in time.
     */
    bool waitForIdle(std::chrono::milliseconds timeout);

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    /**
     * @brief Returns the registered task names.
     */
    [[nodiscard]] std::vector<std::string> taskNames() const;

    /**
     * @brief Returns how many times a task has run.
     * @return Run count, nullopt if the task is unknown.
     */
    [[nodiscard]] std::optional<int> runCount(const std::string& name) const;

    /**
     * @brief Returns how many deadlines of a task were skipped because a run overran.
     * @return Skip count, nullopt if the task is unknown.
     */
    [[nodiscard]] std::optional<int> skippedCount(const std::string& name) const;

private:
    struct ScheduledItem {
        std::string name;
        std::chrono::milliseconds initialDelay{0};
        std::chrono::milliseconds interval{0};
        Action action;
        std::shared_ptr<asio::steady_timer> timer;
        std::chrono::steady_clock::time_point deadline;
        std::atomic<bool> active{false};
        std::atomic<int> runs{0};
        std::atomic<int> skipped{0};
    };

    // Caller must hold mutex_.
    void arm(std::shared_ptr<ScheduledItem> item, std::chrono::steady_clock::time_point deadline);
    void onTimer(const std::shared_ptr<ScheduledItem>& item, const asio::error_code& ec);
    void execute(const std::shared_ptr<ScheduledItem>& item);
    std::chrono::steady_clock::time_point nextDeadline(ScheduledItem& item) const;

    AsioContext& context_;
    std::map<std::string, std::shared_ptr<ScheduledItem>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable idle_;
    int outstanding_{0}; // Guarded by mutex_.
    std::atomic<bool> running_{false};
};

} // namespace hostwatch::infra
