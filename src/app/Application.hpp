#pragma once

#include "app/CommandLine.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/TcpProber.hpp"
#include "infrastructure/notifications/EmailNotificationService.hpp"
#include "infrastructure/scheduling/Scheduler.hpp"
#include "monitor/HealthMonitor.hpp"
#include "monitor/HostRegistry.hpp"

#include <QCoreApplication>
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>

namespace hostwatch::app {

/**
 * @brief Wires the monitoring components together and runs them.
 *
 * The Qt event loop runs on the main thread and carries the HTTP traffic;
 * the scheduled cycles run on the Asio worker threads.
 */
class Application {
public:
    /**
     * @brief Loads the configuration and builds every component.
     * @throws core::ConfigurationError if the configuration is invalid.
     */
    Application(int& argc, char** argv, CommandLineOptions options);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Runs the manual actions, then the scheduler until SIGINT/SIGTERM.
     *
     * With --once only the manual actions are run. A signal received while
     * the manual actions run skips the remaining actions and the scheduler.
     *
     * @return Process exit code.
     */
    int run();

    /**
     * @brief Encrypts the SendGrid API key into the configuration file.
     *
     * Creates the file with defaults if it does not exist yet.
     *
     * @return Process exit code.
     */
    static int storeApiKey(const std::filesystem::path& configPath, const std::string& apiKey);

    infra::ConfigManager& config() { return *config_; }
    monitor::HealthMonitor& healthMonitor() { return *healthMonitor_; }
    infra::Scheduler& scheduler() { return *scheduler_; }

private:
    void initializeLogging();
    void initializeComponents();
    void startScheduler();
    void installSignalHandlers();
    void waitForSignal(); // Caller must hold signalMutex_.
    void runManualActions();
    void shutdown();
    [[nodiscard]] std::chrono::milliseconds runDrainLimit() const;

    CommandLineOptions options_;
    std::unique_ptr<QCoreApplication> qtApp_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<monitor::HostRegistry> registry_;
    std::shared_ptr<infra::TcpProber> prober_;
    std::shared_ptr<infra::EmailNotificationService> notifier_;
    std::unique_ptr<monitor::HealthMonitor> healthMonitor_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::unique_ptr<infra::Scheduler> scheduler_;
    std::unique_ptr<asio::signal_set> signals_;
    std::mutex signalMutex_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> shutdownDone_{false};
};

} // namespace hostwatch::app
