#include <catch2/catch_test_macros.hpp>

#include "cdpflow/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        cdpflow::Error err(cdpflow::ErrorCode::NavigationError, "invalid navigation entry");
        CHECK(err.code() == cdpflow::ErrorCode::NavigationError);
        CHECK(err.message() == "invalid navigation entry");
        CHECK(err.detail() == "");
        CHECK(err.what() == "invalid navigation entry");
    }

    SECTION("error with detail") {
        cdpflow::Error err(cdpflow::ErrorCode::BrowserError,
                           "Navigation failed", "net::ERR_NAME_NOT_RESOLVED");
        CHECK(err.code() == cdpflow::ErrorCode::BrowserError);
        CHECK(err.message() == "Navigation failed");
        CHECK(err.detail() == "net::ERR_NAME_NOT_RESOLVED");
        CHECK(err.what() == "Navigation failed: net::ERR_NAME_NOT_RESOLVED");
    }
}

TEST_CASE("make_error helpers", "[error]") {
    SECTION("two-argument form") {
        auto err = cdpflow::make_error(cdpflow::ErrorCode::ConnectionClosed, "CDP connection closed");
        CHECK(err.code() == cdpflow::ErrorCode::ConnectionClosed);
        CHECK(err.message() == "CDP connection closed");
        CHECK(err.detail() == "");
    }

    SECTION("three-argument form") {
        auto err = cdpflow::make_error(cdpflow::ErrorCode::DeadlineExceeded,
                                       "scope deadline exceeded", "after 30s");
        CHECK(err.code() == cdpflow::ErrorCode::DeadlineExceeded);
        CHECK(err.what() == "scope deadline exceeded: after 30s");
    }
}

TEST_CASE("Cancellation errors are recognised", "[error]") {
    CHECK(cdpflow::make_error(cdpflow::ErrorCode::Cancelled, "x").is_cancellation());
    CHECK(cdpflow::make_error(cdpflow::ErrorCode::DeadlineExceeded, "x").is_cancellation());
    CHECK_FALSE(cdpflow::make_error(cdpflow::ErrorCode::ActionFailed, "x").is_cancellation());
    CHECK_FALSE(cdpflow::make_error(cdpflow::ErrorCode::ConnectionClosed, "x").is_cancellation());
}

TEST_CASE("Result type success case", "[error]") {
    cdpflow::Result<int> result = 42;

    REQUIRE(result.has_value());
    CHECK(*result == 42);
}

TEST_CASE("Result type error case", "[error]") {
    cdpflow::Result<int> result = std::unexpected(
        cdpflow::make_error(cdpflow::ErrorCode::InvalidArgument, "bad value"));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == cdpflow::ErrorCode::InvalidArgument);
    CHECK(result.error().message() == "bad value");
}

TEST_CASE("make_fail and ok_result convert to Result", "[error]") {
    cdpflow::Result<void> ok = cdpflow::ok_result();
    CHECK(ok.has_value());

    cdpflow::Result<int> failed =
        cdpflow::make_fail(cdpflow::make_error(cdpflow::ErrorCode::IoError, "disk full"));
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code() == cdpflow::ErrorCode::IoError);
}

TEST_CASE("ErrorCode names", "[error]") {
    auto to_int = [](cdpflow::ErrorCode c) { return static_cast<int>(c); };
    CHECK(to_int(cdpflow::ErrorCode::Unknown) == 1);

    CHECK(cdpflow::error_code_to_string(cdpflow::ErrorCode::Cancelled) == "CANCELLED");
    CHECK(cdpflow::error_code_to_string(cdpflow::ErrorCode::DeadlineExceeded) == "DEADLINE_EXCEEDED");
    CHECK(cdpflow::error_code_to_string(cdpflow::ErrorCode::UnexpectedOutcome) == "UNEXPECTED_OUTCOME");
    CHECK(cdpflow::error_code_to_string(cdpflow::ErrorCode::NavigationError) == "NAVIGATION_ERROR");
    CHECK(cdpflow::error_code_to_string(cdpflow::ErrorCode::InternalError) == "INTERNAL_ERROR");
}
