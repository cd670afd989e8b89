#include "infrastructure/config/ConfigManager.hpp"

#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

namespace hostwatch::infra {

using json = nlohmann::json;

namespace {

const json* lookup(const json& j, const std::string& section, const std::string& key) {
    auto s = j.find(section);
    if (s == j.end()) {
        return nullptr;
    }
    if (!s->is_object()) {
        throw core::ConfigurationError("Configuration section '" + section +
                                       "' must be an object");
    }
    auto v = s->find(key);
    return v == s->end() ? nullptr : &*v;
}

int readInt(const json& j, const std::string& section, const std::string& key, int fallback,
            int min, int max = std::numeric_limits<int>::max()) {
    const json* v = lookup(j, section, key);
    if (!v) {
        return fallback;
    }

    std::string name = section + "." + key;
    if (!v->is_number_integer()) {
        throw core::ConfigurationError("Configuration value " + name + " must be an integer");
    }

    auto value = v->get<long long>();
    if (value < min || value > max) {
        throw core::ConfigurationError("Configuration value " + name + " out of range: " +
                                       std::to_string(value));
    }
    return static_cast<int>(value);
}

std::string readString(const json& j, const std::string& section, const std::string& key,
                       const std::string& fallback) {
    const json* v = lookup(j, section, key);
    if (!v) {
        return fallback;
    }
    if (!v->is_string()) {
        throw core::ConfigurationError("Configuration value " + section + "." + key +
                                       " must be a string");
    }
    return v->get<std::string>();
}

std::vector<std::string> readList(const json& v, const std::string& name) {
    if (v.is_string()) {
        return ConfigManager::splitList(v.get<std::string>());
    }
    if (!v.is_array()) {
        throw core::ConfigurationError("Configuration value " + name +
                                       " must be a string or an array of strings");
    }

    std::vector<std::string> items;
    for (const auto& item : v) {
        if (!item.is_string()) {
            throw core::ConfigurationError("Configuration value " + name +
                                           " must contain only strings");
        }
        auto parts = ConfigManager::splitList(item.get<std::string>());
        items.insert(items.end(), parts.begin(), parts.end());
    }
    return items;
}

bool isLevelName(const std::string& level) {
    return level == "off" || spdlog::level::from_str(level) != spdlog::level::off;
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configPath) : configPath_(configPath) {}

ConfigManager::~ConfigManager() = default;

std::filesystem::path ConfigManager::keyPath() const {
    return configPath_.parent_path() / ".hostwatch.key";
}

SecureStorage& ConfigManager::secureStorage() {
    if (!secureStorage_) {
        secureStorage_ = std::make_unique<SecureStorage>(keyPath());
    }
    return *secureStorage_;
}

void ConfigManager::load() {
    std::error_code ec;
    if (!std::filesystem::exists(configPath_, ec)) {
        throw core::ConfigurationError("Configuration file not found: " + configPath_.string());
    }

    std::ifstream file(configPath_);
    if (!file) {
        throw core::ConfigurationError("Failed to open configuration file: " +
                                       configPath_.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw core::ConfigurationError("Invalid JSON in " + configPath_.string() + ": " +
                                       e.what());
    }

    if (!j.is_object()) {
        throw core::ConfigurationError("Configuration root must be a JSON object");
    }

    config_ = parse(j);

    secureValues_ = json::object();
    if (auto s = j.find("secure"); s != j.end()) {
        if (!s->is_object()) {
            throw core::ConfigurationError("Configuration section 'secure' must be an object");
        }
        secureValues_ = *s;
    }

    spdlog::info("Loaded configuration from {} ({} host(s))", configPath_.string(),
                 config_.hosts.size());
}

bool ConfigManager::save() {
    json j = toJson(config_);
    if (!secureValues_.empty()) {
        j["secure"] = secureValues_;
    }

    std::ofstream file(configPath_, std::ios::trunc);
    if (!file) {
        spdlog::error("Failed to open config file for writing: {}", configPath_.string());
        return false;
    }

    file << j.dump(2) << '\n';
    if (!file) {
        spdlog::error("Failed to write config file: {}", configPath_.string());
        return false;
    }

    spdlog::debug("Saved configuration to {}", configPath_.string());
    return true;
}

AppConfig ConfigManager::parse(const json& j) {
    AppConfig config;

    if (auto h = j.find("hosts"); h != j.end()) {
        config.hosts = readList(*h, "hosts");
    }

    config.tcpPort = readInt(j, "tcp", "port", config.tcpPort, 1, 65535);
    config.tcpTimeoutMs = readInt(j, "tcp", "timeout_ms", config.tcpTimeoutMs, 1);
    config.tcpRetries = readInt(j, "tcp", "retries", config.tcpRetries, 1);

    config.alertThrottleMinutes =
        readInt(j, "alert", "throttle_minutes", config.alertThrottleMinutes, 0);

    config.checkIntervalMinutes =
        readInt(j, "check", "interval_minutes", config.checkIntervalMinutes, 1);
    config.reportTime = core::DailyTime::parse(readString(j, "report", "time", "00:00"));
    config.reportIntervalHours =
        readInt(j, "report", "interval_hours", config.reportIntervalHours, 1);

    config.logFile = readString(j, "log", "file", config.logFile);
    config.logLevel = readString(j, "log", "level", config.logLevel);
    if (!isLevelName(config.logLevel)) {
        throw core::ConfigurationError("Unknown log level: " + config.logLevel);
    }

    config.emailFrom = readString(j, "email", "from", config.emailFrom);
    config.emailFromName = readString(j, "email", "from_name", config.emailFromName);
    if (const json* to = lookup(j, "email", "to")) {
        config.emailTo = readList(*to, "email.to");
    }
    config.emailTimeoutMs = readInt(j, "email", "timeout_ms", config.emailTimeoutMs, 1);
    config.emailEndpoint = readString(j, "email", "endpoint", config.emailEndpoint);
    if (config.emailEndpoint.empty()) {
        throw core::ConfigurationError("Configuration value email.endpoint must not be empty");
    }

    config.sendgridApiKey = readString(j, "sendgrid", "api_key", config.sendgridApiKey);

    return config;
}

json ConfigManager::toJson(const AppConfig& config) {
    json j;

    j["hosts"] = config.hosts;

    j["tcp"]["port"] = config.tcpPort;
    j["tcp"]["timeout_ms"] = config.tcpTimeoutMs;
    j["tcp"]["retries"] = config.tcpRetries;

    j["alert"]["throttle_minutes"] = config.alertThrottleMinutes;

    j["check"]["interval_minutes"] = config.checkIntervalMinutes;
    j["report"]["time"] = config.reportTime.toString();
    j["report"]["interval_hours"] = config.reportIntervalHours;

    j["log"]["file"] = config.logFile;
    j["log"]["level"] = config.logLevel;

    j["email"]["from"] = config.emailFrom;
    j["email"]["from_name"] = config.emailFromName;
    j["email"]["to"] = config.emailTo;
    j["email"]["timeout_ms"] = config.emailTimeoutMs;
    j["email"]["endpoint"] = config.emailEndpoint;

    if (!config.sendgridApiKey.empty()) {
        j["sendgrid"]["api_key"] = config.sendgridApiKey;
    }

    return j;
}

std::vector<std::string> ConfigManager::splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        auto first = item.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            continue;
        }
        auto last = item.find_last_not_of(" \t\r\n");
        items.push_back(item.substr(first, last - first + 1));
    }
    return items;
}

bool ConfigManager::setSecureValue(const std::string& key, const std::string& value) {
    auto encrypted = secureStorage().encrypt(value);
    if (encrypted.empty()) {
        return false;
    }
    secureValues_[key] = encrypted;
    return save();
}

std::optional<std::string> ConfigManager::getSecureValue(const std::string& key) {
    auto it = secureValues_.find(key);
    if (it == secureValues_.end() || !it->is_string()) {
        return std::nullopt;
    }
    return secureStorage().decrypt(it->get<std::string>());
}

std::string ConfigManager::sendgridApiKey() {
    if (secureValues_.contains(API_KEY_NAME)) {
        if (auto key = getSecureValue(API_KEY_NAME)) {
            return *key;
        }
        spdlog::warn("Stored SendGrid API key could not be decrypted, using plaintext value");
    }
    return config_.sendgridApiKey;
}

} // namespace hostwatch::infra
