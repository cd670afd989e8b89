#pragma once

#include "core/types/DailyTime.hpp"
#include "infrastructure/crypto/SecureStorage.hpp"

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hostwatch::infra {

/**
 * @brief Validated application configuration.
 *
 * Defaults apply to every key missing from the file.
 */
struct AppConfig {
    // Monitored hosts
    std::vector<std::string> hosts; ///< Hostnames in configuration order.

    // Probing
    int tcpPort{80};         ///< Port probed on every host.
    int tcpTimeoutMs{2000};  ///< Connect timeout per attempt.
    int tcpRetries{3};       ///< Attempts per probe.

    // Alerting
    int alertThrottleMinutes{30}; ///< Minimum gap between CRITICAL alerts per host.

    // Scheduling
    int checkIntervalMinutes{10};  ///< Period of the check cycle.
    core::DailyTime reportTime;    ///< Local time of the first report.
    int reportIntervalHours{24};   ///< Period of the report cycle.

    // Logging
    std::string logFile{"hostmonitor.log"}; ///< Rotating log file path.
    std::string logLevel{"info"};           ///< spdlog level name.

    // E-mail
    std::string emailFrom;                  ///< Sender address.
    std::string emailFromName{"Host Monitor"}; ///< Sender display name.
    std::vector<std::string> emailTo;       ///< Recipient addresses.
    int emailTimeoutMs{10000};              ///< Upper bound for one delivery.
    std::string emailEndpoint{"https://api.sendgrid.com/v3/mail/send"}; ///< Mail-send URL.
    std::string sendgridApiKey;             ///< Plaintext API key, if any.
};

/**
 * @brief Loads, validates and saves the JSON configuration file.
 *
 * Secrets live under the "secure" object, encrypted by SecureStorage with a
 * key file next to the configuration file.
 */
class ConfigManager {
public:
    /// Secure-value name of the SendGrid API key.
    static constexpr const char* API_KEY_NAME = "sendgrid_api_key";

    /**
     * @brief Constructs a ConfigManager for a configuration file.
     * @param configPath Path to the JSON file.
     */
    explicit ConfigManager(const std::filesystem::path& configPath);

    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * @brief Reads and validates the configuration file.
     * @throws core::ConfigurationError if the file is missing or unreadable, is not
     *         valid JSON, or holds a value of the wrong type or out of range.
     */
    void load();

    /**
     * @brief Writes the current configuration and secure values to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Stores an encrypted value and rewrites the configuration file.
     * @param key Name of the value.
     * @param value Secret to store.
     * @return True if the value was encrypted and the file saved.
     */
    bool setSecureValue(const std::string& key, const std::string& value);

    /**
     * @brief Retrieves and decrypts a stored value.
     * @param key Name of the value.
     * @return Decrypted value if present and decryptable, nullopt otherwise.
     */
    std::optional<std::string> getSecureValue(const std::string& key);

    /**
     * @brief Returns the API key to use for SendGrid.
     *
     * The encrypted value wins over the plaintext one; if it cannot be
     * decrypted the plaintext value is used.
     */
    std::string sendgridApiKey();

    const std::filesystem::path& configPath() const { return configPath_; }

    /**
     * @brief Returns the path of the encryption key file.
     */
    std::filesystem::path keyPath() const;

    /**
     * @brief Parses a JSON document into a validated configuration.
     * @throws core::ConfigurationError on the first invalid value.
     */
    static AppConfig parse(const nlohmann::json& j);

    /**
     * @brief Serializes a configuration using the same layout parse() reads.
     */
    static nlohmann::json toJson(const AppConfig& config);

    /**
     * @brief Splits a comma-separated list, trimming entries and dropping empty ones.
     */
    static std::vector<std::string> splitList(const std::string& text);

private:
    SecureStorage& secureStorage();

    std::filesystem::path configPath_;
    AppConfig config_;
    nlohmann::json secureValues_ = nlohmann::json::object();
    std::unique_ptr<SecureStorage> secureStorage_;
};

} // namespace hostwatch::infra
