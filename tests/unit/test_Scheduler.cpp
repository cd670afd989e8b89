#include <catch2/catch_test_macros.hpp>

#include "infrastructure/scheduling/Scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>

using namespace hostwatch::infra;
using namespace std::chrono_literals;

namespace {

template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds limit = 3s) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

} // namespace

TEST_CASE("Scheduler task registration", "[Scheduler]") {
    AsioContext context(2);
    Scheduler scheduler(context);

    SECTION("Accepts distinct names") {
        CHECK(scheduler.addTask("host-check", 0ms, 10ms, [] {}));
        CHECK(scheduler.addTask("daily-report", 0ms, 10ms, [] {}));

        auto names = scheduler.taskNames();
        CHECK(names.size() == 2);
        CHECK(std::find(names.begin(), names.end(), "host-check") != names.end());
    }

    SECTION("Rejects a duplicate name") {
        REQUIRE(scheduler.addTask("host-check", 0ms, 10ms, [] {}));
        CHECK_FALSE(scheduler.addTask("host-check", 0ms, 20ms, [] {}));
    }

    SECTION("Rejects a non-positive interval") {
        CHECK_FALSE(scheduler.addTask("zero", 0ms, 0ms, [] {}));
        CHECK_FALSE(scheduler.addTask("negative", 0ms, -5ms, [] {}));
    }

    SECTION("Unknown task has no counters") {
        CHECK_FALSE(scheduler.runCount("missing").has_value());
        CHECK_FALSE(scheduler.skippedCount("missing").has_value());
    }

    SECTION("Nothing runs before start") {
        std::atomic<int> runs{0};
        scheduler.addTask("idle", 0ms, 10ms, [&runs] { ++runs; });
        context.start();
        std::this_thread::sleep_for(50ms);

        CHECK(runs == 0);
        CHECK_FALSE(scheduler.isRunning());
    }
}

TEST_CASE("Scheduler periodic execution", "[Scheduler]") {
    // Counters outlive the scheduler so no late run touches a dead object.
    std::atomic<int> runs{0};
    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};
    std::atomic<int> checks{0};
    std::atomic<int> reports{0};

    AsioContext context(2);
    context.start();
    Scheduler scheduler(context);

    SECTION("Runs a task repeatedly") {
        scheduler.addTask("tick", 0ms, 20ms, [&runs] { ++runs; });
        scheduler.start();

        CHECK(waitFor([&runs] { return runs >= 3; }));
        CHECK(scheduler.runCount("tick").value_or(0) >= 3);
    }

    SECTION("Honors the initial delay") {
        scheduler.addTask("late", 300ms, 1s, [&runs] { ++runs; });
        scheduler.start();

        std::this_thread::sleep_for(100ms);
        CHECK(runs == 0);
        CHECK(waitFor([&runs] { return runs == 1; }));
    }

    SECTION("A task never overlaps itself") {

        scheduler.addTask("slow", 0ms, 10ms, [&] {
            int now = ++active;
            int seen = maxActive.load();
            while (now > seen && !maxActive.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(35ms);
            --active;
            ++runs;
        });
        scheduler.start();

        REQUIRE(waitFor([&runs] { return runs >= 3; }));
        scheduler.stop();

        CHECK(maxActive == 1);
        CHECK(scheduler.skippedCount("slow").value_or(0) > 0);
    }

    SECTION("Two tasks run independently") {
        scheduler.addTask("host-check", 0ms, 15ms, [&checks] { ++checks; });
        scheduler.addTask("daily-report", 0ms, 15ms, [&reports] { ++reports; });
        scheduler.start();

        CHECK(waitFor([&] { return checks >= 2 && reports >= 2; }));
    }

    SECTION("An exception does not cancel the task") {
        scheduler.addTask("flaky", 0ms, 10ms, [&runs] {
            ++runs;
            throw std::runtime_error("boom");
        });
        scheduler.start();

        CHECK(waitFor([&runs] { return runs >= 3; }));
    }

    SECTION("Stop prevents further runs") {
        scheduler.addTask("tick", 0ms, 10ms, [&runs] { ++runs; });
        scheduler.start();
        REQUIRE(waitFor([&runs] { return runs >= 1; }));

        scheduler.stop();
        std::this_thread::sleep_for(30ms);
        int afterStop = runs;
        std::this_thread::sleep_for(60ms);

        CHECK(runs == afterStop);
        CHECK_FALSE(scheduler.isRunning());
    }

    SECTION("Task added while running is armed") {
        scheduler.start();
        scheduler.addTask("added-late", 0ms, 10ms, [&runs] { ++runs; });

        CHECK(waitFor([&runs] { return runs >= 1; }));
    }

    scheduler.stop();
    context.stop();
}

TEST_CASE("Scheduler shutdown with a run in progress", "[Scheduler]") {
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};

    AsioContext context(2);
    context.start();

    auto slowTask = [&started, &finished] {
        started = true;
        std::this_thread::sleep_for(200ms);
        finished = true;
    };

    SECTION("waitForIdle reports the run until it completes") {
        Scheduler scheduler(context);
        scheduler.addTask("slow", 0ms, 1h, slowTask);
        scheduler.start();
        REQUIRE(waitFor([&started] { return started.load(); }));

        scheduler.stop();
        CHECK_FALSE(scheduler.waitForIdle(10ms));
        CHECK(scheduler.waitForIdle(2s));
        CHECK(finished);
    }

    SECTION("Destruction waits for the run") {
        {
            Scheduler scheduler(context);
            scheduler.addTask("slow", 0ms, 1h, slowTask);
            scheduler.start();
            REQUIRE(waitFor([&started] { return started.load(); }));
        }
        CHECK(finished);
    }

    SECTION("Idle scheduler with a cancelled timer") {
        Scheduler scheduler(context);
        scheduler.addTask("later", 1h, 1h, [] {});
        scheduler.start();
        scheduler.stop();

        CHECK(scheduler.waitForIdle(2s));
    }

    context.stop();
}
