/// @file test_overflow.cpp
/// @brief Overflow policies observed through a Hub

#include <catch2/catch_test_macros.hpp>
#include "hub_test_support.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace relay_hub;
using relay_core::HubError;
using relay_hub_test::tokens;
using relay_hub_test::transcript;

TEST_CASE("Overflow: DropOldest reports the gap before the newest elements", "[hub][overflow]") {
    Hub<int> hub(HubConfig{}.with_name("oldest").with_capacity(4));
    auto inlet = hub.take_inlet().unwrap();
    auto slow = hub.subscribe();

    for (int i = 1; i <= 10; ++i) {
        REQUIRE(inlet.push(i).is_ok());
    }
    REQUIRE(inlet.complete().is_ok());

    REQUIRE(slow.dropped_count() == 6);
    REQUIRE(transcript(slow) == tokens({"DROP(6)", "7", "8", "9", "10", "END"}));
    REQUIRE(hub.stats().dropped == 6);
}

TEST_CASE("Overflow: DropNewest keeps the oldest elements", "[hub][overflow]") {
    Hub<int> hub(HubConfig{}.with_name("newest")
        .with_overflow(OverflowPolicy::DropNewest)
        .with_capacity(4));
    auto inlet = hub.take_inlet().unwrap();
    auto slow = hub.subscribe();

    for (int i = 1; i <= 10; ++i) {
        REQUIRE(inlet.push(i).is_ok());
    }
    REQUIRE(inlet.complete().is_ok());

    REQUIRE(transcript(slow) == tokens({"1", "2", "3", "4", "DROP(6)", "END"}));
}

TEST_CASE("Overflow: a slow subscriber does not affect a fast one", "[hub][overflow]") {
    Hub<int> hub(HubConfig{}.with_name("mixed").with_capacity(64));
    auto inlet = hub.take_inlet().unwrap();
    auto slow = hub.subscribe(2);
    auto fast = hub.subscribe();

    REQUIRE(slow.capacity() == 2);
    REQUIRE(fast.capacity() == 64);

    for (int i = 1; i <= 5; ++i) {
        REQUIRE(inlet.push(i).is_ok());
    }
    REQUIRE(inlet.complete().is_ok());

    REQUIRE(transcript(fast) == tokens({"1", "2", "3", "4", "5", "END"}));
    REQUIRE(transcript(slow) == tokens({"DROP(3)", "4", "5", "END"}));
}

TEST_CASE("Overflow: FailFast fails the hub for every subscriber", "[hub][overflow]") {
    Hub<int> hub(HubConfig{}.with_name("strict")
        .with_overflow(OverflowPolicy::FailFast)
        .with_capacity(2));
    auto inlet = hub.take_inlet().unwrap();
    auto a = hub.subscribe();
    auto b = hub.subscribe();

    REQUIRE(inlet.push(1).is_ok());
    REQUIRE(inlet.push(2).is_ok());

    auto overflow = inlet.push(3);
    REQUIRE(overflow.is_err());
    REQUIRE(overflow.error().is_hub(HubError::Kind::HubFailed));
    REQUIRE(overflow.error().get_context("cause") != nullptr);
    REQUIRE(*overflow.error().get_context("cause") == "SubscriberOverflow");

    REQUIRE(hub.state() == HubState::Failed);
    REQUIRE(hub.stats().overflows == 1);

    REQUIRE(transcript(a) == tokens({"1", "2", "FAIL"}));
    REQUIRE(transcript(b) == tokens({"1", "2", "FAIL"}));

    auto after = inlet.push(4);
    REQUIRE(after.is_err());
    REQUIRE(after.error().is_hub(HubError::Kind::HubFailed));
}

TEST_CASE("Overflow: FailFast in worker mode", "[hub][overflow][threading]") {
    Hub<int> hub(HubConfig{}.with_name("strict_worker")
        .with_overflow(OverflowPolicy::FailFast)
        .with_dispatch(DispatchMode::Worker)
        .with_capacity(1));
    auto inlet = hub.take_inlet().unwrap();
    auto a = hub.subscribe();

    REQUIRE(inlet.push(1).is_ok());
    REQUIRE(inlet.push(2).is_ok());

    // Leave the buffer full until the dispatch thread has hit the overflow
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (hub.state() != HubState::Failed && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    REQUIRE(hub.state() == HubState::Failed);
    REQUIRE(transcript(a) == tokens({"1", "FAIL"}));

    auto after = inlet.push(3);
    REQUIRE(after.is_err());
    REQUIRE(after.error().is_hub(HubError::Kind::HubFailed));
}

TEST_CASE("Overflow: BlockProducer loses nothing", "[hub][overflow][threading]") {
    Hub<int> hub(HubConfig{}.with_name("lossless")
        .with_overflow(OverflowPolicy::BlockProducer)
        .with_capacity(1));
    auto inlet = hub.take_inlet().unwrap();
    auto sub = hub.subscribe();

    std::thread producer([&inlet] {
        for (int i = 1; i <= 20; ++i) {
            (void)inlet.push(i);
        }
        (void)inlet.complete();
    });

    std::vector<std::string> got;
    while (true) {
        auto delivery = sub.next();
        got.push_back(relay_hub_test::token(delivery));
        if (delivery.is_terminal()) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    producer.join();

    REQUIRE(got.size() == 21);
    for (int i = 1; i <= 20; ++i) {
        REQUIRE(got[static_cast<std::size_t>(i - 1)] == std::to_string(i));
    }
    REQUIRE(got.back() == "END");
    REQUIRE(sub.dropped_count() == 0);
}

TEST_CASE("Overflow: BlockProducer is released when the subscriber leaves", "[hub][overflow][threading]") {
    Hub<int> hub(HubConfig{}.with_name("released")
        .with_overflow(OverflowPolicy::BlockProducer)
        .with_capacity(1));
    auto inlet = hub.take_inlet().unwrap();
    auto sub = hub.subscribe();

    REQUIRE(inlet.push(1).is_ok());

    std::atomic<bool> returned{false};
    std::thread producer([&] {
        (void)inlet.push(2);
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE_FALSE(returned);

    SECTION("by detach") {
        sub.detach();
        producer.join();
        REQUIRE(returned);
        REQUIRE(hub.state() == HubState::Running);
    }

    SECTION("by shutdown") {
        hub.shutdown();
        producer.join();
        REQUIRE(returned);
        REQUIRE(hub.state() == HubState::Completed);
    }

    REQUIRE(sub.next().value() == 1);
    REQUIRE(sub.next().is_end());
}
