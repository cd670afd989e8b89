#include <catch2/catch_test_macros.hpp>

#include "monitor/HealthMonitor.hpp"
#include "support/FakeServices.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>

using namespace hostwatch::core;
using namespace hostwatch::monitor;
using namespace hostwatch::test;
using namespace std::chrono_literals;

namespace {

MonitorSettings testSettings() {
    MonitorSettings settings;
    settings.port = 8080;
    settings.probeTimeout = 250ms;
    settings.probeRetries = 2;
    settings.throttleWindow = 30min;
    return settings;
}

struct MonitorFixture {
    HostRegistry registry{std::vector<std::string>{"a.test", "b.test"}};
    std::shared_ptr<FakeProber> prober = std::make_shared<FakeProber>();
    std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();
    ManualClock clock;
    HealthMonitor monitor{registry, prober, notifier, MessageFormatter({"ops@example.com"}),
                          testSettings(), clock.source()};
};

} // namespace

TEST_CASE("HealthMonitor check cycle", "[HealthMonitor]") {
    MonitorFixture f;

    SECTION("Passes the configured probe parameters") {
        f.monitor.checkHosts();

        CHECK(f.prober->calls() == std::vector<std::string>{"a.test", "b.test"});
        CHECK(f.prober->lastPort() == 8080);
        CHECK(f.prober->lastTimeout() == 250ms);
        CHECK(f.prober->lastRetries() == 2);
    }

    SECTION("All reachable: no state change, no alerts") {
        auto summary = f.monitor.checkHosts();

        CHECK(summary.hostsChecked == 2);
        CHECK(summary.hostsUp == 2);
        CHECK(summary.hostsDown == 0);
        CHECK(summary.alertsSent == 0);
        CHECK(f.notifier->count() == 0);
    }

    SECTION("One host unreachable") {
        f.prober->setReachable("a.test", false);
        auto summary = f.monitor.checkHosts();

        auto a = f.registry.get("a.test");
        CHECK_FALSE(a->up);
        CHECK(a->failCount == 1);
        CHECK(f.registry.get("b.test")->up);

        CHECK(summary.hostsDown == 1);
        CHECK(summary.alertsSent == 1);
        REQUIRE(f.notifier->count() == 1);
        CHECK(f.notifier->messages()[0].subject == "CRITICAL: Host a.test is DOWN");
        CHECK(f.notifier->messages()[0].recipients == std::vector<std::string>{"ops@example.com"});
    }

    SECTION("Recovery sends one recovery alert and resets the count") {
        f.prober->setReachable("a.test", false);
        f.monitor.checkHosts();
        f.clock.advance(10min);
        f.monitor.checkHosts();
        REQUIRE(f.registry.get("a.test")->failCount == 2);

        f.prober->setReachable("a.test", true);
        f.clock.advance(10min);
        f.monitor.checkHosts();

        auto a = f.registry.get("a.test");
        CHECK(a->up);
        CHECK(a->failCount == 0);
        CHECK(f.notifier->countWithPrefix("RECOVERED:") == 1);
        CHECK(f.notifier->messages().back().body.find("Total failures: 2") != std::string::npos);
    }

    SECTION("A probe error on one host does not stop the cycle") {
        f.prober->setThrows("a.test");
        f.prober->setReachable("b.test", false);
        auto summary = f.monitor.checkHosts();

        CHECK(summary.errors == 1);
        CHECK(summary.hostsChecked == 1);
        CHECK(f.registry.get("a.test")->up);
        CHECK_FALSE(f.registry.get("b.test")->up);
    }

    SECTION("A failing notifier does not stop the cycle") {
        f.notifier->setThrowOnSend(true);
        f.prober->setReachable("a.test", false);
        f.prober->setReachable("b.test", false);
        auto summary = f.monitor.checkHosts();

        CHECK(summary.errors == 0);
        CHECK(summary.hostsDown == 2);
        CHECK(f.registry.get("a.test")->lastAlertAt == f.clock.now());
    }

    SECTION("Unknown host is ignored") {
        CHECK_FALSE(f.monitor.checkHost("unknown.test"));
        CHECK(f.notifier->count() == 0);
    }
}

TEST_CASE("HealthMonitor daily report", "[HealthMonitor]") {
    MonitorFixture f;
    f.registry.modify("a.test", [](HostState& s) { s.failCount = 2; });
    f.registry.modify("b.test", [](HostState& s) {
        s.up = false;
        s.failCount = 5;
    });

    SECTION("Sends the summary and resets counts") {
        auto status = f.monitor.sendDailyReport();

        CHECK(status.succeeded());
        REQUIRE(f.notifier->count() == 1);
        const auto& body = f.notifier->messages()[0].body;
        CHECK(body.find("Total: 2, UP: 1, DOWN: 1") != std::string::npos);
        CHECK(f.registry.get("a.test")->failCount == 0);
        CHECK(f.registry.get("b.test")->failCount == 0);
        CHECK_FALSE(f.registry.get("b.test")->up);
    }

    SECTION("Counts are reset even if delivery fails") {
        f.notifier->setResult(NotificationResult::Failed);
        auto status = f.monitor.sendDailyReport();

        CHECK_FALSE(status.succeeded());
        CHECK(f.registry.get("a.test")->failCount == 0);
        CHECK(f.registry.get("b.test")->failCount == 0);
    }

    SECTION("A throwing notifier is reported as Failed") {
        f.notifier->setThrowOnSend(true);
        auto status = f.monitor.sendDailyReport();

        CHECK(status.result == NotificationResult::Failed);
        CHECK(status.errorMessage == "transport unavailable");
        CHECK(f.registry.get("b.test")->failCount == 0);
    }
}

TEST_CASE("HealthMonitor simulate down", "[HealthMonitor]") {
    MonitorFixture f;

    SECTION("Known host is forced DOWN with an alert") {
        REQUIRE(f.monitor.simulateHostDown("a.test"));

        auto a = f.registry.get("a.test");
        CHECK_FALSE(a->up);
        CHECK(a->failCount == 0);
        CHECK(a->lastAlertAt == f.clock.now());
        CHECK(f.notifier->countWithPrefix("CRITICAL:") == 1);
    }

    SECTION("Ignores the throttle window") {
        f.monitor.simulateHostDown("a.test");
        f.clock.advance(1min);
        f.monitor.simulateHostDown("a.test");

        CHECK(f.notifier->countWithPrefix("CRITICAL:") == 2);
    }

    SECTION("The next failed check is throttled") {
        f.monitor.simulateHostDown("a.test");
        f.prober->setReachable("a.test", false);
        f.clock.advance(10min);
        f.monitor.checkHosts();

        CHECK(f.registry.get("a.test")->failCount == 1);
        CHECK(f.notifier->count() == 1);
    }

    SECTION("Unknown host changes nothing") {
        auto before = f.registry.snapshot();

        CHECK_FALSE(f.monitor.simulateHostDown("unknown.test"));
        CHECK(f.registry.snapshot() == before);
        CHECK(f.notifier->count() == 0);
    }
}

TEST_CASE("HealthMonitor logs suppressed alerts", "[HealthMonitor]") {
    auto previous = spdlog::default_logger();
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);
    sink->set_pattern("%v");
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("capture", sink));

    MonitorFixture f;
    auto throttledLines = [&sink]() {
        auto lines = sink->last_formatted();
        return std::count_if(lines.begin(), lines.end(), [](const std::string& line) {
            return line.find("Alert for host a.test throttled") != std::string::npos;
        });
    };

    f.prober->setReachable("a.test", false);
    f.monitor.checkHosts();
    CHECK(throttledLines() == 0);

    SECTION("Still-down host inside the window") {
        f.clock.advance(10min);
        f.monitor.checkHosts();

        CHECK(f.notifier->count() == 1);
        CHECK(throttledLines() == 1);
    }

    SECTION("Host going down again inside the window") {
        f.prober->setReachable("a.test", true);
        f.clock.advance(10min);
        f.monitor.checkHosts();
        f.prober->setReachable("a.test", false);
        f.clock.advance(10min);
        f.monitor.checkHosts();

        CHECK(f.notifier->countWithPrefix("CRITICAL") == 1);
        CHECK(throttledLines() == 1);
    }

    spdlog::set_default_logger(previous);
}
