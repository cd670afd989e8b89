#include "app/CommandLine.hpp"

#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace hostwatch::app {

namespace {

bool isOption(const std::string& arg) {
    return arg.rfind("--", 0) == 0;
}

} // namespace

std::string ManualAction::kindToString(Kind kind) {
    switch (kind) {
    case Kind::CheckNow:
        return "check-now";
    case Kind::SendReport:
        return "send-report";
    case Kind::SimulateDown:
        return "simulate-down";
    }
    return "unknown";
}

CommandLineOptions parseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool hasValue = i + 1 < args.size() && !isOption(args[i + 1]);

        if (arg == "--check-now") {
            options.actions.push_back({ManualAction::Kind::CheckNow, {}});
        } else if (arg == "--send-report") {
            options.actions.push_back({ManualAction::Kind::SendReport, {}});
        } else if (arg == "--simulate-down") {
            if (!hasValue) {
                spdlog::warn("--simulate-down requires a host name, ignoring");
                continue;
            }
            options.actions.push_back({ManualAction::Kind::SimulateDown, args[++i]});
        } else if (arg == "--config") {
            if (!hasValue) {
                throw core::ConfigurationError("--config requires a file path");
            }
            options.configPath = args[++i];
        } else if (arg == "--set-api-key") {
            if (!hasValue) {
                throw core::ConfigurationError("--set-api-key requires a value");
            }
            options.apiKeyToStore = args[++i];
        } else if (arg == "--once") {
            options.once = true;
        } else if (arg == "--dry-run") {
            options.dryRun = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else {
            spdlog::warn("Unknown argument ignored: {}", arg);
            options.ignored.push_back(arg);
        }
    }

    return options;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "Monitors TCP reachability of the configured hosts, e-mails alerts and a\n"
        << "periodic status report.\n"
        << "\n"
        << "Options:\n"
        << "  --config <path>         Configuration file (default: hostwatch.json)\n"
        << "  --check-now             Run a check cycle immediately\n"
        << "  --send-report           Send the status report immediately\n"
        << "  --simulate-down <host>  Mark a host DOWN and send a CRITICAL alert\n"
        << "  --once                  Run the requested actions and exit\n"
        << "  --dry-run               Log messages instead of sending them\n"
        << "  --set-api-key <key>     Store the SendGrid API key encrypted and exit\n"
        << "  --help                  Show this help and exit\n";
    return out.str();
}

} // namespace hostwatch::app
