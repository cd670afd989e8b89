#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hostwatch::app {

/**
 * @brief A one-off action requested on the command line.
 */
struct ManualAction {
    enum class Kind { CheckNow, SendReport, SimulateDown };

    Kind kind{Kind::CheckNow};
    std::string host; ///< Target host for SimulateDown.

    static std::string kindToString(Kind kind);

    bool operator==(const ManualAction& other) const = default;
};

/**
 * @brief Parsed command-line options.
 */
struct CommandLineOptions {
    std::filesystem::path configPath{"hostwatch.json"}; ///< Configuration file.
    std::vector<ManualAction> actions;                  ///< Manual actions in argument order.
    std::optional<std::string> apiKeyToStore;           ///< Value of --set-api-key.
    std::vector<std::string> ignored;                   ///< Arguments that were not understood.
    bool once{false};   ///< Run the manual actions and exit.
    bool dryRun{false}; ///< Render messages without sending them.
    bool help{false};   ///< Print usage and exit.
};

/**
 * @brief Parses program arguments (without the program name).
 *
 * Unknown arguments and a --simulate-down without a host are logged as
 * warnings and skipped.
 *
 * @param args Arguments in order.
 * @return Parsed options.
 * @throws core::ConfigurationError if --config or --set-api-key lacks its value.
 */
CommandLineOptions parseCommandLine(const std::vector<std::string>& args);

/**
 * @brief Returns the usage text printed by --help.
 * @param program Program name shown in the synopsis.
 */
std::string usage(const std::string& program);

} // namespace hostwatch::app
