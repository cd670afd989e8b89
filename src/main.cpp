#include "app/Application.hpp"
#include "app/CommandLine.hpp"
#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        auto options = hostwatch::app::parseCommandLine(args);

        if (options.help) {
            std::cout << hostwatch::app::usage(argv[0]);
            return 0;
        }

        if (options.apiKeyToStore) {
            return hostwatch::app::Application::storeApiKey(options.configPath,
                                                            *options.apiKeyToStore);
        }

        hostwatch::app::Application app(argc, argv, std::move(options));
        return app.run();
    } catch (const hostwatch::core::ConfigurationError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
