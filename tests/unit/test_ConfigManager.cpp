#include <catch2/catch_test_macros.hpp>

#include "core/Errors.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

using namespace hostwatch::core;
using namespace hostwatch::infra;
using json = nlohmann::json;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "hostwatch_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }
    std::filesystem::path file() const { return configDir_ / "hostwatch.json"; }

    void write(const std::string& content) const {
        std::ofstream out(file());
        out << content;
    }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

} // namespace

TEST_CASE("ConfigManager defaults", "[ConfigManager]") {
    auto config = ConfigManager::parse(json::object());

    CHECK(config.hosts.empty());
    CHECK(config.tcpPort == 80);
    CHECK(config.tcpTimeoutMs == 2000);
    CHECK(config.tcpRetries == 3);
    CHECK(config.alertThrottleMinutes == 30);
    CHECK(config.checkIntervalMinutes == 10);
    CHECK(config.reportTime == DailyTime{0, 0});
    CHECK(config.reportIntervalHours == 24);
    CHECK(config.logFile == "hostmonitor.log");
    CHECK(config.logLevel == "info");
    CHECK(config.emailFromName == "Host Monitor");
    CHECK(config.emailTimeoutMs == 10000);
    CHECK(config.emailEndpoint == "https://api.sendgrid.com/v3/mail/send");
    CHECK(config.sendgridApiKey.empty());
}

TEST_CASE("ConfigManager parsing", "[ConfigManager]") {
    SECTION("Hosts as comma-separated string") {
        auto config = ConfigManager::parse(json{{"hosts", " a.test, b.test ,,c.test "}});
        CHECK(config.hosts == std::vector<std::string>{"a.test", "b.test", "c.test"});
    }

    SECTION("Hosts as array") {
        auto config = ConfigManager::parse(json{{"hosts", {"a.test", "b.test"}}});
        CHECK(config.hosts == std::vector<std::string>{"a.test", "b.test"});
    }

    SECTION("All sections") {
        auto j = json::parse(R"({
            "hosts": "a.test",
            "tcp": {"port": 443, "timeout_ms": 1500, "retries": 5},
            "alert": {"throttle_minutes": 0},
            "check": {"interval_minutes": 5},
            "report": {"time": "07:30", "interval_hours": 12},
            "log": {"file": "/tmp/hw.log", "level": "debug"},
            "email": {"from": "monitor@example.com", "from_name": "Ops",
                      "to": ["ops@example.com", "noc@example.com"], "timeout_ms": 3000,
                      "endpoint": "http://127.0.0.1:9/mail"},
            "sendgrid": {"api_key": "SG.plain"}
        })");
        auto config = ConfigManager::parse(j);

        CHECK(config.tcpPort == 443);
        CHECK(config.tcpTimeoutMs == 1500);
        CHECK(config.tcpRetries == 5);
        CHECK(config.alertThrottleMinutes == 0);
        CHECK(config.checkIntervalMinutes == 5);
        CHECK(config.reportTime == DailyTime{7, 30});
        CHECK(config.reportIntervalHours == 12);
        CHECK(config.logFile == "/tmp/hw.log");
        CHECK(config.logLevel == "debug");
        CHECK(config.emailFrom == "monitor@example.com");
        CHECK(config.emailFromName == "Ops");
        CHECK(config.emailTo.size() == 2);
        CHECK(config.emailTimeoutMs == 3000);
        CHECK(config.emailEndpoint == "http://127.0.0.1:9/mail");
        CHECK(config.sendgridApiKey == "SG.plain");
    }

    SECTION("Recipients as comma-separated string") {
        auto config = ConfigManager::parse(json{{"email", {{"to", "a@example.com, b@example.com"}}}});
        CHECK(config.emailTo == std::vector<std::string>{"a@example.com", "b@example.com"});
    }
}

TEST_CASE("ConfigManager validation", "[ConfigManager]") {
    SECTION("Port out of range") {
        CHECK_THROWS_AS(ConfigManager::parse(json{{"tcp", {{"port", 0}}}}), ConfigurationError);
        CHECK_THROWS_AS(ConfigManager::parse(json{{"tcp", {{"port", 70000}}}}), ConfigurationError);
    }

    SECTION("Non-positive timeout and retries") {
        CHECK_THROWS_AS(ConfigManager::parse(json{{"tcp", {{"timeout_ms", 0}}}}),
                        ConfigurationError);
        CHECK_THROWS_AS(ConfigManager::parse(json{{"tcp", {{"retries", 0}}}}), ConfigurationError);
    }

    SECTION("Negative throttle") {
        CHECK_THROWS_AS(ConfigManager::parse(json{{"alert", {{"throttle_minutes", -1}}}}),
                        ConfigurationError);
    }

    SECTION("Wrong types") {
        CHECK_THROWS_AS(ConfigManager::parse(json{{"tcp", {{"port", "80"}}}}), ConfigurationError);
        CHECK_THROWS_AS(ConfigManager::parse(json{{"tcp", 80}}), ConfigurationError);
        CHECK_THROWS_AS(ConfigManager::parse(json{{"hosts", 42}}), ConfigurationError);
        CHECK_THROWS_AS(ConfigManager::parse(json{{"hosts", {"a.test", 1}}}), ConfigurationError);
        CHECK_THROWS_AS(ConfigManager::parse(json{{"tcp", {{"timeout_ms", 1.5}}}}),
                        ConfigurationError);
    }

    SECTION("Bad report time") {
        CHECK_THROWS_AS(ConfigManager::parse(json{{"report", {{"time", "25:00"}}}}),
                        ConfigurationError);
    }

    SECTION("Unknown log level") {
        CHECK_THROWS_AS(ConfigManager::parse(json{{"log", {{"level", "loud"}}}}),
                        ConfigurationError);
        CHECK_NOTHROW(ConfigManager::parse(json{{"log", {{"level", "off"}}}}));
    }
}

TEST_CASE("ConfigManager file handling", "[ConfigManager]") {
    TestConfigDir dir;

    SECTION("Missing file") {
        ConfigManager manager(dir.file());
        CHECK_THROWS_AS(manager.load(), ConfigurationError);
    }

    SECTION("Invalid JSON") {
        dir.write("{ not json");
        ConfigManager manager(dir.file());
        CHECK_THROWS_AS(manager.load(), ConfigurationError);
    }

    SECTION("Root must be an object") {
        dir.write("[1, 2, 3]");
        ConfigManager manager(dir.file());
        CHECK_THROWS_AS(manager.load(), ConfigurationError);
    }

    SECTION("Load and save round trip") {
        dir.write(R"({"hosts": "a.test,b.test", "tcp": {"port": 8080}})");
        ConfigManager manager(dir.file());
        manager.load();
        REQUIRE(manager.config().hosts.size() == 2);

        manager.config().alertThrottleMinutes = 45;
        REQUIRE(manager.save());

        ConfigManager reloaded(dir.file());
        reloaded.load();
        CHECK(reloaded.config().hosts == manager.config().hosts);
        CHECK(reloaded.config().tcpPort == 8080);
        CHECK(reloaded.config().alertThrottleMinutes == 45);
    }

    SECTION("Key file lives beside the configuration") {
        ConfigManager manager(dir.file());
        CHECK(manager.keyPath() == dir.path() / ".hostwatch.key");
    }
}

TEST_CASE("ConfigManager secure values", "[ConfigManager]") {
    TestConfigDir dir;
    dir.write(R"({"hosts": "a.test", "sendgrid": {"api_key": "SG.plain"}})");

    SECTION("Plaintext key is used when nothing is encrypted") {
        ConfigManager manager(dir.file());
        manager.load();
        CHECK(manager.sendgridApiKey() == "SG.plain");
        CHECK_FALSE(manager.getSecureValue(ConfigManager::API_KEY_NAME).has_value());
    }

    SECTION("Encrypted key takes precedence and survives a reload") {
        {
            ConfigManager manager(dir.file());
            manager.load();
            REQUIRE(manager.setSecureValue(ConfigManager::API_KEY_NAME, "SG.secret"));
        }

        std::ifstream raw(dir.file());
        std::string content((std::istreambuf_iterator<char>(raw)), std::istreambuf_iterator<char>());
        CHECK(content.find("SG.secret") == std::string::npos);
        CHECK(std::filesystem::exists(dir.path() / ".hostwatch.key"));

        ConfigManager reloaded(dir.file());
        reloaded.load();
        CHECK(reloaded.getSecureValue(ConfigManager::API_KEY_NAME) == "SG.secret");
        CHECK(reloaded.sendgridApiKey() == "SG.secret");
    }

    SECTION("Undecryptable key falls back to plaintext") {
        {
            ConfigManager manager(dir.file());
            manager.load();
            REQUIRE(manager.setSecureValue(ConfigManager::API_KEY_NAME, "SG.secret"));
        }
        std::filesystem::remove(dir.path() / ".hostwatch.key");

        ConfigManager reloaded(dir.file());
        reloaded.load();
        CHECK(reloaded.sendgridApiKey() == "SG.plain");
    }
}
