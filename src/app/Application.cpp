#include "app/Application.hpp"

#include "core/Errors.hpp"

#include <QEventLoop>
#include <QMetaObject>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>

namespace hostwatch::app {

namespace {

constexpr const char* APP_VERSION = "1.0.0";

monitor::MonitorSettings monitorSettings(const infra::AppConfig& config) {
    monitor::MonitorSettings settings;
    settings.port = static_cast<uint16_t>(config.tcpPort);
    settings.probeTimeout = std::chrono::milliseconds(config.tcpTimeoutMs);
    settings.probeRetries = config.tcpRetries;
    settings.throttleWindow = std::chrono::minutes(config.alertThrottleMinutes);
    return settings;
}

infra::EmailSettings emailSettings(const infra::AppConfig& config, std::string apiKey) {
    infra::EmailSettings settings;
    settings.apiKey = std::move(apiKey);
    settings.fromAddress = config.emailFrom;
    settings.fromName = config.emailFromName;
    settings.endpoint = config.emailEndpoint;
    settings.timeoutMs = config.emailTimeoutMs;
    return settings;
}

} // namespace

Application::Application(int& argc, char** argv, CommandLineOptions options)
    : options_(std::move(options)) {
    qtApp_ = std::make_unique<QCoreApplication>(argc, argv);
    qtApp_->setApplicationName("HostWatch");
    qtApp_->setApplicationVersion(APP_VERSION);

    config_ = std::make_unique<infra::ConfigManager>(options_.configPath);
    config_->load();

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    shutdown();
    spdlog::info("HostWatch stopped");
}

void Application::initializeLogging() {
    const auto& cfg = config_->config();

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::info);

    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.logFile, 5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger =
        std::make_shared<spdlog::logger>("hostwatch", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(spdlog::level::from_str(cfg.logLevel));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::info("HostWatch {} starting...", APP_VERSION);
    spdlog::info("Log file: {}", cfg.logFile);
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    registry_ = std::make_unique<monitor::HostRegistry>(cfg.hosts);

    prober_ = std::make_shared<infra::TcpProber>();

    notifier_ = std::make_shared<infra::EmailNotificationService>(
        emailSettings(cfg, config_->sendgridApiKey()));
    if (options_.dryRun) {
        spdlog::info("Dry run: messages are logged, not sent");
        notifier_->setEnabled(false);
    } else if (!notifier_->isConfigured()) {
        spdlog::warn("E-mail delivery is not configured; alerts will only be logged");
    }

    healthMonitor_ = std::make_unique<monitor::HealthMonitor>(
        *registry_, prober_, notifier_, monitor::MessageFormatter(cfg.emailTo),
        monitorSettings(cfg));

    asioContext_ = std::make_unique<infra::AsioContext>(2, "scheduler");
    scheduler_ = std::make_unique<infra::Scheduler>(*asioContext_);

    spdlog::info("Application components initialized");
}

void Application::startScheduler() {
    const auto& cfg = config_->config();

    auto checkInterval = std::chrono::minutes(cfg.checkIntervalMinutes);
    auto reportInterval = std::chrono::hours(cfg.reportIntervalHours);
    auto reportDelay = cfg.reportTime.delayUntilNext(std::chrono::system_clock::now());

    scheduler_->addTask("host-check", std::chrono::milliseconds(0), checkInterval,
                        [this]() { healthMonitor_->checkHosts(); });
    scheduler_->addTask("daily-report", reportDelay, reportInterval,
                        [this]() { healthMonitor_->sendDailyReport(); });

    scheduler_->start();

    spdlog::info("Monitoring {} host(s) on port {}: checks every {} min, report at {} every {} h",
                 registry_->size(), cfg.tcpPort, cfg.checkIntervalMinutes,
                 cfg.reportTime.toString(), cfg.reportIntervalHours);
}

void Application::installSignalHandlers() {
    std::lock_guard lock(signalMutex_);
    signals_ = std::make_unique<asio::signal_set>(asioContext_->getContext(), SIGINT, SIGTERM);
    waitForSignal();
}

void Application::waitForSignal() {
    signals_->async_wait([this](const asio::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down", signal);
        stopRequested_ = true;
        QMetaObject::invokeMethod(
            qtApp_.get(), []() { QCoreApplication::quit(); }, Qt::QueuedConnection);

        std::lock_guard lock(signalMutex_);
        if (signals_) {
            waitForSignal();
        }
    });
}

void Application::runManualActions() {
    for (const auto& action : options_.actions) {
        if (stopRequested_) {
            spdlog::info("Stop requested, skipping remaining manual actions");
            return;
        }
        spdlog::info("Manual action: {}", ManualAction::kindToString(action.kind));
        switch (action.kind) {
        case ManualAction::Kind::CheckNow:
            healthMonitor_->checkHosts();
            break;
        case ManualAction::Kind::SendReport:
            healthMonitor_->sendDailyReport();
            break;
        case ManualAction::Kind::SimulateDown:
            healthMonitor_->simulateHostDown(action.host);
            break;
        }
    }
}

int Application::run() {
    if (options_.once) {
        if (options_.actions.empty()) {
            spdlog::warn("--once given without any action; nothing to do");
        }
        runManualActions();
        return 0;
    }

    asioContext_->start();
    installSignalHandlers();

    // Manual actions own the main thread; the scheduled cycles start afterwards so
    // their e-mails are not queued behind a blocked event loop.
    runManualActions();

    int exitCode = 0;
    if (stopRequested_) {
        spdlog::info("Stop requested before the event loop started");
    } else {
        startScheduler();
        exitCode = qtApp_->exec();
    }
    shutdown();
    return exitCode;
}

void Application::shutdown() {
    if (shutdownDone_.exchange(true)) {
        return;
    }

    {
        std::lock_guard lock(signalMutex_);
        if (signals_) {
            asio::error_code ec;
            signals_->cancel(ec);
        }
    }

    if (scheduler_) {
        scheduler_->stop();

        // A run still in progress may be waiting for this thread to post its e-mail.
        auto limit = std::chrono::steady_clock::now() + runDrainLimit();
        while (!scheduler_->waitForIdle(std::chrono::milliseconds(50)) &&
               std::chrono::steady_clock::now() < limit) {
            QCoreApplication::processEvents(QEventLoop::AllEvents, 50);
        }
    }

    if (asioContext_) {
        asioContext_->stop();
    }

    std::lock_guard lock(signalMutex_);
    signals_.reset();
}

std::chrono::milliseconds Application::runDrainLimit() const {
    const auto& cfg = config_->config();
    // Probe every host, then deliver an alert for each.
    auto probing = std::chrono::milliseconds(cfg.tcpTimeoutMs) * cfg.tcpRetries *
                   static_cast<int>(cfg.hosts.size());
    auto delivery =
        std::chrono::milliseconds(cfg.emailTimeoutMs + 1000) * static_cast<int>(cfg.hosts.size());
    return probing + delivery + std::chrono::seconds(1);
}

int Application::storeApiKey(const std::filesystem::path& configPath, const std::string& apiKey) {
    infra::ConfigManager config(configPath);

    std::error_code ec;
    if (std::filesystem::exists(configPath, ec)) {
        config.load();
    } else {
        spdlog::info("Creating configuration file {}", configPath.string());
    }

    if (!config.setSecureValue(infra::ConfigManager::API_KEY_NAME, apiKey)) {
        spdlog::error("Failed to store the SendGrid API key");
        return 1;
    }

    spdlog::info("SendGrid API key stored encrypted in {}", configPath.string());
    return 0;
}

} // namespace hostwatch::app
