#pragma once

#include <stdexcept>
#include <string>

namespace hostwatch::core {

/**
 * @brief Missing or invalid configuration detected at startup.
 *
 * Fatal: the application logs it and exits with a non-zero status.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace hostwatch::core
