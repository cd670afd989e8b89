#include <catch2/catch_test_macros.hpp>

#include "core/types/Notification.hpp"

using namespace hostwatch::core;

TEST_CASE("NotificationStatus", "[Notification]") {
    NotificationStatus status;

    SECTION("Default status is a failure") {
        CHECK(status.result == NotificationResult::Failed);
        CHECK_FALSE(status.succeeded());
        CHECK(status.httpStatus == 0);
    }

    SECTION("Only Success counts as succeeded") {
        status.result = NotificationResult::Success;
        CHECK(status.succeeded());

        status.result = NotificationResult::Skipped;
        CHECK_FALSE(status.succeeded());

        status.result = NotificationResult::TimedOut;
        CHECK_FALSE(status.succeeded());
    }

    SECTION("resultToString") {
        status.result = NotificationResult::Success;
        CHECK(status.resultToString() == "Success");
        status.result = NotificationResult::Failed;
        CHECK(status.resultToString() == "Failed");
        status.result = NotificationResult::Skipped;
        CHECK(status.resultToString() == "Skipped");
        status.result = NotificationResult::TimedOut;
        CHECK(status.resultToString() == "TimedOut");
    }
}

TEST_CASE("EmailMessage equality", "[Notification]") {
    EmailMessage a{"subject", "body", {"ops@example.com"}};
    EmailMessage b = a;

    CHECK(a == b);

    b.recipients.push_back("noc@example.com");
    CHECK_FALSE(a == b);
}
