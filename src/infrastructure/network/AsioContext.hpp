#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace hostwatch::infra {

/**
 * @brief Worker pool running an Asio I/O context.
 *
 * Scheduled tasks, timers and signal handling are dispatched on these
 * threads. The thread count bounds how many tasks execute at once. An
 * exception escaping a handler is logged and the worker resumes running
 * the context, so one faulty handler cannot shrink the pool.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext.
     * @param threadCount Number of worker threads (at least one is used).
     * @param name Label used in log messages.
     */
    explicit AsioContext(size_t threadCount = 2, std::string name = "worker");

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the context and joins the worker threads.
     *
     * Handlers still queued are not run. The context can be started again.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] size_t threadCount() const { return threadCount_; }

    /**
     * @brief Returns the number of handler exceptions caught so far.
     */
    [[nodiscard]] int handlerFailures() const { return handlerFailures_.load(); }

    asio::io_context& getContext() { return ioContext_; }

private:
    void workerLoop(size_t index);

    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::atomic<int> handlerFailures_{0};
    size_t threadCount_;
    std::string name_;
};

} // namespace hostwatch::infra
