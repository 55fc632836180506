// relay_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <relay/core/error.hpp>
#include <stdexcept>
#include <string>

using namespace relay_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err(std::string("Test error"));
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error hub kinds map to codes", "[core][error]") {
    SECTION("contract_violation") {
        Error err = HubError::contract_violation("ticks", "push after complete()");
        REQUIRE(err.code() == ErrorCode::ContractViolation);
        REQUIRE(err.is_hub(HubError::Kind::ContractViolation));
        REQUIRE(err.message().find("ticks") != std::string::npos);
    }

    SECTION("subscriber_overflow") {
        Error err = HubError::subscriber_overflow("ticks", 7, 16);
        REQUIRE(err.code() == ErrorCode::Overflow);
        REQUIRE(err.as<HubError>()->subscription == 7);
    }

    SECTION("hub_failed") {
        Error err = HubError::hub_failed("ticks", "upstream lost");
        REQUIRE(err.code() == ErrorCode::Failed);
        REQUIRE_FALSE(err.is_hub(HubError::Kind::HubClosed));
    }

    SECTION("hub_closed") {
        Error err = HubError::hub_closed("ticks");
        REQUIRE(err.code() == ErrorCode::Closed);
    }

    SECTION("inlet_unavailable") {
        Error err = HubError::inlet_unavailable("ticks");
        REQUIRE(err.code() == ErrorCode::InvalidState);
    }
}

TEST_CASE("Error ingest kinds map to codes", "[core][error]") {
    Error rejected = IngestError::batch_write_rejected("events", "queue full");
    REQUIRE(rejected.code() == ErrorCode::Rejected);
    REQUIRE(rejected.is_ingest(IngestError::Kind::BatchWriteRejected));
    REQUIRE_FALSE(rejected.is<HubError>());

    Error failed = IngestError::write_failed("events", "disk");
    REQUIRE(failed.code() == ErrorCode::IOError);

    Error exhausted = IngestError::retries_exhausted("events", 3, 6);
    REQUIRE(exhausted.as<IngestError>()->batch_index == 3);
    REQUIRE(exhausted.message().find("6 attempts") != std::string::npos);
}

TEST_CASE("build_error_chain includes kind and context", "[core][error]") {
    Error err = HubError::hub_failed("ticks", "overflow");
    err.with_context("cause", "SubscriberOverflow");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[Failed]") != std::string::npos);
    REQUIRE(chain.find("HubError:HubFailed") != std::string::npos);
    REQUIRE(chain.find("cause=SubscriberOverflow") != std::string::npos);
}

// =============================================================================
// Result Tests
// =============================================================================

TEST_CASE("Result with value", "[core][result]") {
    Result<int> result = Ok(42);
    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.value() == 42);
    REQUIRE(*result == 42);
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result with error", "[core][result]") {
    Result<int> result = Err<int>(Error(ErrorCode::NotFound, "missing"));
    REQUIRE(result.is_err());
    REQUIRE_FALSE(result);
    REQUIRE(result.error().code() == ErrorCode::NotFound);
    REQUIRE(result.value_or(7) == 7);
    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result void", "[core][result]") {
    SECTION("ok") {
        Result<void> result = Ok();
        REQUIRE(result.is_ok());
        REQUIRE_NOTHROW(result.unwrap());
    }

    SECTION("error carries message into unwrap") {
        Result<void> result = Err(Error(HubError::hub_closed("ticks")));
        REQUIRE(result.is_err());
        try {
            result.unwrap();
            FAIL("unwrap should throw");
        } catch (const std::runtime_error& e) {
            REQUIRE(std::string(e.what()).find("ticks") != std::string::npos);
        }
    }
}

TEST_CASE("Result map and and_then", "[core][result]") {
    Result<int> result = Ok(20);
    auto doubled = result.map([](int v) { return v * 2; });
    REQUIRE(doubled.value() == 40);

    auto chained = Result<int>(Ok(5)).and_then([](int v) -> Result<std::string> {
        return Ok(std::to_string(v));
    });
    REQUIRE(chained.value() == "5");

    Result<int> failed = Err<int>(Error(ErrorCode::Failed, "nope"));
    auto mapped = failed.map([](int v) { return v + 1; });
    REQUIRE(mapped.is_err());
    REQUIRE(mapped.error().message() == "nope");
}

// =============================================================================
// Error Statistics
// =============================================================================

TEST_CASE("Error statistics count by kind", "[core][error][stats]") {
    debug::reset_error_stats();

    debug::record_error(HubError::hub_closed("a"));
    debug::record_error(IngestError::write_failed("b", "x"));
    debug::record_error(Error(ErrorCode::Failed, "generic"));

    REQUIRE(debug::total_error_count() == 3);
    REQUIRE(debug::hub_error_count() == 1);
    REQUIRE(debug::ingest_error_count() == 1);
    REQUIRE(debug::error_stats_summary().find("Total: 3") != std::string::npos);

    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}
