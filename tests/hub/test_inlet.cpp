/// @file test_inlet.cpp
/// @brief Producer handle contract

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "hub_test_support.hpp"

#include <utility>

using namespace relay_hub;
using relay_core::HubError;

TEST_CASE("Inlet: only one producer handle per hub", "[hub][inlet]") {
    Hub<int> hub(HubConfig{}.with_name("single"));

    auto first = hub.take_inlet();
    REQUIRE(first.is_ok());
    REQUIRE(first->is_valid());

    auto second = hub.take_inlet();
    REQUIRE(second.is_err());
    REQUIRE(second.error().is_hub(HubError::Kind::InletUnavailable));
}

TEST_CASE("Inlet: default and moved-from handles are unavailable", "[hub][inlet]") {
    Hub<int> hub(HubConfig{}.with_name("moved"));
    auto inlet = hub.take_inlet().unwrap();

    Inlet<int> moved = std::move(inlet);
    REQUIRE(moved);
    REQUIRE_FALSE(inlet.is_valid());

    auto pushed = inlet.push(1);
    REQUIRE(pushed.is_err());
    REQUIRE(pushed.error().is_hub(HubError::Kind::InletUnavailable));

    Inlet<int> empty;
    REQUIRE_FALSE(empty);
    REQUIRE(empty.complete().is_err());

    REQUIRE(moved.push(1).is_ok());
}

TEST_CASE("Inlet: calls after complete are contract violations", "[hub][inlet]") {
    auto mode = GENERATE(DispatchMode::Inline, DispatchMode::Worker);
    Hub<int> hub(HubConfig{}.with_name("contract").with_dispatch(mode));
    auto inlet = hub.take_inlet().unwrap();
    auto sub = hub.subscribe();

    REQUIRE(inlet.push(1).is_ok());
    REQUIRE(inlet.complete().is_ok());

    SECTION("push") {
        auto pushed = inlet.push(2);
        REQUIRE(pushed.is_err());
        REQUIRE(pushed.error().is_hub(HubError::Kind::ContractViolation));
        REQUIRE(pushed.error().code() == relay_core::ErrorCode::ContractViolation);
    }

    SECTION("second complete") {
        auto again = inlet.complete();
        REQUIRE(again.is_err());
        REQUIRE(again.error().is_hub(HubError::Kind::ContractViolation));
    }

    SECTION("fail after complete") {
        auto failed = inlet.fail(relay_core::Error("too late"));
        REQUIRE(failed.is_err());
        REQUIRE(failed.error().is_hub(HubError::Kind::ContractViolation));
    }

    // The rejected call never disturbs what subscribers see
    REQUIRE(relay_hub_test::transcript(sub) == relay_hub_test::tokens({"1", "END"}));
}

TEST_CASE("Inlet: push after owner shutdown reports HubClosed", "[hub][inlet]") {
    Hub<int> hub(HubConfig{}.with_name("closed"));
    auto inlet = hub.take_inlet().unwrap();

    hub.shutdown();

    auto pushed = inlet.push(1);
    REQUIRE(pushed.is_err());
    REQUIRE(pushed.error().is_hub(HubError::Kind::HubClosed));
}

TEST_CASE("Inlet: outliving the hub is safe", "[hub][inlet]") {
    Inlet<int> inlet;
    {
        Hub<int> hub(HubConfig{}.with_name("gone"));
        inlet = hub.take_inlet().unwrap();
    }

    REQUIRE(inlet.is_valid());
    auto pushed = inlet.push(1);
    REQUIRE(pushed.is_err());
    REQUIRE(pushed.error().is_hub(HubError::Kind::HubClosed));
}

TEST_CASE("Inlet: push to a failed hub reports HubFailed", "[hub][inlet]") {
    Hub<int> hub(HubConfig{}.with_name("failing")
        .with_overflow(OverflowPolicy::FailFast)
        .with_capacity(1));
    auto inlet = hub.take_inlet().unwrap();
    auto sub = hub.subscribe();

    REQUIRE(inlet.push(1).is_ok());
    REQUIRE(inlet.push(2).is_err());

    auto pushed = inlet.push(3);
    REQUIRE(pushed.is_err());
    REQUIRE(pushed.error().is_hub(HubError::Kind::HubFailed));
    REQUIRE(pushed.error().code() == relay_core::ErrorCode::Failed);

    // Closing a failed hub reports the failure rather than a contract violation
    auto completed = inlet.complete();
    REQUIRE(completed.is_err());
    REQUIRE(completed.error().is_hub(HubError::Kind::HubFailed));
}
