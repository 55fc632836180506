/// @file test_derived_view.cpp
/// @brief Shared transformation stages between hubs

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "hub_test_support.hpp"

#include <atomic>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

using namespace relay_hub;
using relay_hub_test::tokens;
using relay_hub_test::transcript;

namespace {

/// Doubles its input and counts how often it ran
class CountingDoubler : public Transform<int, int> {
public:
    explicit CountingDoubler(std::shared_ptr<std::atomic<int>> calls)
        : m_calls(std::move(calls)) {}

    void apply(const int& input, const Emit& emit) override {
        m_calls->fetch_add(1);
        emit(input * 2);
    }

private:
    std::shared_ptr<std::atomic<int>> m_calls;
};

int sum(const std::vector<int>& values) {
    return std::accumulate(values.begin(), values.end(), 0);
}

} // anonymous namespace

TEST_CASE("DerivedView: transform runs once per element for any number of consumers", "[hub][derived]") {
    Hub<int> upstream(HubConfig{}.with_name("raw"));
    auto inlet = upstream.take_inlet().unwrap();

    auto calls = std::make_shared<std::atomic<int>>(0);
    DerivedView<int, int> doubled(upstream, std::make_unique<CountingDoubler>(calls),
        HubConfig{}.with_name("doubled"));

    auto a = doubled.subscribe();
    auto b = doubled.subscribe();
    auto c = doubled.subscribe();

    for (int i = 1; i <= 4; ++i) {
        REQUIRE(inlet.push(i).is_ok());
    }
    REQUIRE(inlet.complete().is_ok());

    auto expected = tokens({"2", "4", "6", "8", "END"});
    REQUIRE(transcript(a) == expected);
    REQUIRE(transcript(b) == expected);
    REQUIRE(transcript(c) == expected);

    REQUIRE(calls->load() == 4);
    REQUIRE(doubled.invocations() == 4);
    REQUIRE(upstream.subscriber_count() == 1);
}

TEST_CASE("DerivedView: map may change the element type", "[hub][derived]") {
    Hub<int> upstream(HubConfig{}.with_name("numbers"));
    auto inlet = upstream.take_inlet().unwrap();

    DerivedView<int, std::string> labels(upstream,
        make_map<int, std::string>([](const int& v) { return "#" + std::to_string(v); }),
        HubConfig{}.with_name("labels"));

    std::vector<std::string> seen;
    labels.attach_callback([&seen](const std::string& s) { seen.push_back(s); });

    REQUIRE(inlet.push(1).is_ok());
    REQUIRE(inlet.push(2).is_ok());
    REQUIRE(seen == std::vector<std::string>{"#1", "#2"});
}

TEST_CASE("DerivedView: sliding window", "[hub][derived]") {
    Hub<int> upstream(HubConfig{}.with_name("samples"));
    auto inlet = upstream.take_inlet().unwrap();

    SECTION("overlapping windows flush the partial tail") {
        DerivedView<int, int> windows(upstream, make_window<int, int>(3, 2, sum));
        auto sub = windows.subscribe();

        for (int i = 1; i <= 6; ++i) {
            REQUIRE(inlet.push(i).is_ok());
        }
        REQUIRE(inlet.complete().is_ok());

        REQUIRE(transcript(sub) == tokens({"6", "12", "11", "END"}));
    }

    SECTION("tumbling windows with nothing left over") {
        DerivedView<int, int> windows(upstream, make_window<int, int>(2, 2, sum));
        auto sub = windows.subscribe();

        for (int i = 1; i <= 4; ++i) {
            REQUIRE(inlet.push(i).is_ok());
        }
        REQUIRE(inlet.complete().is_ok());

        REQUIRE(transcript(sub) == tokens({"3", "7", "END"}));
    }

    SECTION("step larger than the window skips elements") {
        DerivedView<int, int> windows(upstream, make_window<int, int>(2, 3, sum));
        auto sub = windows.subscribe();

        for (int i = 1; i <= 7; ++i) {
            REQUIRE(inlet.push(i).is_ok());
        }
        REQUIRE(inlet.complete().is_ok());

        // [1,2] skip 3, [4,5] skip 6, [7] partial
        REQUIRE(transcript(sub) == tokens({"3", "9", "7", "END"}));
    }
}

TEST_CASE("DerivedView: scan emits the running aggregate", "[hub][derived]") {
    Hub<int> upstream(HubConfig{}.with_name("deltas"));
    auto inlet = upstream.take_inlet().unwrap();

    DerivedView<int, int> totals(upstream,
        make_scan<int, int>(0, [](int acc, const int& v) { return acc + v; }));
    auto sub = totals.subscribe();

    for (int i = 1; i <= 4; ++i) {
        REQUIRE(inlet.push(i).is_ok());
    }
    REQUIRE(inlet.complete().is_ok());

    REQUIRE(transcript(sub) == tokens({"1", "3", "6", "10", "END"}));
}

TEST_CASE("DerivedView: views compose", "[hub][derived]") {
    Hub<int> upstream(HubConfig{}.with_name("source"));
    auto inlet = upstream.take_inlet().unwrap();

    DerivedView<int, int> shifted(upstream,
        make_map<int, int>([](const int& v) { return v + 1; }),
        HubConfig{}.with_name("shifted"));
    DerivedView<int, int> evens(shifted.output(),
        make_filter<int>([](const int& v) { return v % 2 == 0; }),
        HubConfig{}.with_name("evens"));

    auto sub = evens.subscribe();
    for (int i = 1; i <= 5; ++i) {
        REQUIRE(inlet.push(i).is_ok());
    }
    REQUIRE(inlet.complete().is_ok());

    REQUIRE(transcript(sub) == tokens({"2", "4", "6", "END"}));
    REQUIRE(shifted.invocations() == 5);
    REQUIRE(evens.invocations() == 5);
}

TEST_CASE("DerivedView: upstream failure propagates downstream", "[hub][derived]") {
    Hub<int> upstream(HubConfig{}.with_name("flaky"));
    auto inlet = upstream.take_inlet().unwrap();

    DerivedView<int, int> view(upstream, make_map<int, int>([](const int& v) { return v; }));
    auto sub = view.subscribe();

    REQUIRE(inlet.push(1).is_ok());
    REQUIRE(inlet.fail(relay_core::Error(relay_core::ErrorCode::IOError, "sensor offline")).is_ok());

    REQUIRE(transcript(sub) == tokens({"1", "FAIL"}));
    auto failed = sub.next();
    REQUIRE(failed.error().message() == "sensor offline");
    REQUIRE(view.output().state() == HubState::Failed);
}

TEST_CASE("DerivedView: throwing transform fails the downstream hub", "[hub][derived]") {
    auto mode = GENERATE(DispatchMode::Inline, DispatchMode::Worker);
    Hub<int> upstream(HubConfig{}.with_name("readings").with_dispatch(mode));
    auto inlet = upstream.take_inlet().unwrap();

    DerivedView<int, int> view(upstream, make_map<int, int>([](const int& v) {
        if (v == 2) {
            throw std::runtime_error("bad reading");
        }
        return v * 10;
    }), HubConfig{}.with_name("scaled"));
    auto sub = view.subscribe();

    for (int i = 1; i <= 3; ++i) {
        REQUIRE(inlet.push(i).is_ok());
    }
    REQUIRE(inlet.complete().is_ok());

    REQUIRE(transcript(sub) == tokens({"10", "FAIL"}));
    auto failed = sub.next();
    REQUIRE(failed.error().is_hub(relay_core::HubError::Kind::HubFailed));
    REQUIRE(view.output().state() == HubState::Failed);
    REQUIRE(view.invocations() == 2);
}

TEST_CASE("DerivedView: throwing flush fails the downstream hub", "[hub][derived]") {
    Hub<int> upstream(HubConfig{}.with_name("partial"));
    auto inlet = upstream.take_inlet().unwrap();

    DerivedView<int, int> view(upstream, make_window<int, int>(3, 3, [](const std::vector<int>& w) {
        if (w.size() < 3) {
            throw std::runtime_error("short window");
        }
        return sum(w);
    }));
    auto sub = view.subscribe();

    for (int i = 1; i <= 4; ++i) {
        REQUIRE(inlet.push(i).is_ok());
    }
    REQUIRE(inlet.complete().is_ok());

    REQUIRE(transcript(sub) == tokens({"6", "FAIL"}));
    REQUIRE(view.output().state() == HubState::Failed);
}

TEST_CASE("DerivedView: worker-mode upstream", "[hub][derived][threading]") {
    Hub<int> upstream(HubConfig{}.with_name("async").with_dispatch(DispatchMode::Worker));
    auto inlet = upstream.take_inlet().unwrap();

    DerivedView<int, int> view(upstream, make_map<int, int>([](const int& v) { return v * v; }));
    auto sub = view.subscribe();

    for (int i = 1; i <= 3; ++i) {
        REQUIRE(inlet.push(i).is_ok());
    }
    REQUIRE(inlet.complete().is_ok());

    REQUIRE(transcript(sub) == tokens({"1", "4", "9", "END"}));
}

TEST_CASE("DerivedView: created on a finished upstream ends immediately", "[hub][derived]") {
    Hub<int> upstream(HubConfig{}.with_name("finished"));
    auto inlet = upstream.take_inlet().unwrap();
    REQUIRE(inlet.complete().is_ok());

    DerivedView<int, int> view(upstream, make_map<int, int>([](const int& v) { return v; }));
    REQUIRE_FALSE(view.upstream_id().is_valid());
    REQUIRE(view.output().state() == HubState::Completed);

    auto sub = view.subscribe();
    REQUIRE(sub.next().is_end());
}

TEST_CASE("DerivedView: destroying the view detaches it from upstream", "[hub][derived]") {
    Hub<int> upstream(HubConfig{}.with_name("long_lived"));
    auto inlet = upstream.take_inlet().unwrap();

    {
        DerivedView<int, int> view(upstream, make_map<int, int>([](const int& v) { return v; }));
        REQUIRE(upstream.subscriber_count() == 1);
    }

    REQUIRE(upstream.subscriber_count() == 0);
    REQUIRE(upstream.state() == HubState::Running);
    REQUIRE(inlet.push(1).is_ok());
}
