/// @file main.cpp
/// @brief Live Feed Demo
///
/// One simulated sensor feeds a hub. A raw consumer prints readings, a shared
/// moving-average view serves two consumers, and a batch writer loads every
/// reading into an in-memory destination.
///
/// Usage: live_feed [--config path.json] [--hub.overflow_policy=drop_newest] ...

#include <relay/core/config.hpp>
#include <relay/core/log.hpp>
#include <relay/hub/hub.hpp>
#include <relay/ingest/ingest.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <numeric>
#include <thread>
#include <vector>

namespace {

struct Reading {
    std::uint64_t seq = 0;
    double value = 0.0;
};

/// Build configuration: defaults < project file < environment < command line
relay_core::Result<void> load_configuration(relay_core::ConfigManager& config, int argc, char* argv[]) {
    config.setup_defaults();
    config.set_int("feed.readings", 200, "defaults");
    config.set_int("feed.interval_ms", 2, "defaults");
    config.set_int("feed.window", 5, "defaults");

    auto args = config.parse_args(argc, argv);
    if (!args) {
        return args;
    }

    if (config.contains("config")) {
        auto path = config.get_string("config");
        auto loaded = config.load_json(path, "project");
        if (!loaded) {
            return loaded;
        }
        spdlog::info("Loaded configuration from {}", path);
    }

    config.load_environment("RELAY_");
    return relay_core::Ok();
}

double average(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
    relay_core::ConfigManager config;
    auto loaded = load_configuration(config, argc, argv);
    if (!loaded) {
        spdlog::error("Configuration error: {}", loaded.error().message());
        return EXIT_FAILURE;
    }

    auto log_config = relay_core::log_config_from(config);
    if (!log_config) {
        spdlog::error("Logging configuration error: {}", log_config.error().message());
        return EXIT_FAILURE;
    }
    relay_core::configure_logging(*log_config);

    auto hub_config = relay_hub::hub_config_from(config);
    if (!hub_config) {
        spdlog::error("Hub configuration error: {}", hub_config.error().message());
        return EXIT_FAILURE;
    }
    auto ingest_config = relay_ingest::ingest_config_from(config);
    if (!ingest_config) {
        spdlog::error("Ingest configuration error: {}", ingest_config.error().message());
        return EXIT_FAILURE;
    }

    const auto readings = static_cast<std::uint64_t>(config.get_int("feed.readings"));
    const auto interval = std::chrono::milliseconds(config.get_int("feed.interval_ms"));
    const auto window = static_cast<std::size_t>(config.get_int("feed.window"));

    spdlog::info("=== Live Feed Demo ===");

    // Raw hub
    auto created = relay_hub::Hub<Reading>::create(*hub_config);
    if (!created) {
        spdlog::error("Failed to create hub: {}", created.error().message());
        return EXIT_FAILURE;
    }
    relay_hub::Hub<Reading> sensor = std::move(created).value();

    // Shared moving average; computed once for all of its consumers
    relay_hub::DerivedView<Reading, double> smoothed(sensor,
        relay_hub::make_window<Reading, double>(window, 1, [](const std::vector<Reading>& w) {
            std::vector<double> values;
            values.reserve(w.size());
            for (const auto& r : w) {
                values.push_back(r.value);
            }
            return average(values);
        }),
        relay_hub::HubConfig(*hub_config).with_name(sensor.name() + ".smoothed"));

    double peak = 0.0;
    smoothed.attach_callback(
        [&peak](const double& v) { peak = std::max(peak, v); },
        [] { spdlog::info("Smoothed stream ended"); });
    auto smoothed_reader = smoothed.subscribe();
    std::size_t smoothed_count = 0;
    std::thread smoothed_thread([&smoothed_reader, &smoothed_count] {
        for (;;) {
            auto delivery = smoothed_reader.next();
            if (delivery.is_terminal()) {
                break;
            }
            if (delivery.is_element()) {
                ++smoothed_count;
            }
        }
    });

    // Batch ingestion of the raw stream
    auto ingest_sub = sensor.subscribe();
    relay_ingest::MemoryDestination<Reading> destination;
    relay_ingest::BatchWriter<Reading> writer(destination, *ingest_config);
    relay_ingest::IngestReport report;
    std::thread ingest_thread([&] {
        report = writer.drain("readings", ingest_sub);
    });

    auto raw = sensor.subscribe();

    // Producer on its own thread
    auto inlet = sensor.take_inlet().unwrap();
    std::thread producer([&inlet, readings, interval] {
        for (std::uint64_t seq = 0; seq < readings; ++seq) {
            Reading reading{seq, 20.0 + 5.0 * std::sin(static_cast<double>(seq) / 10.0)};
            auto pushed = inlet.push(reading);
            if (!pushed) {
                spdlog::warn("Producer stopped: {}", pushed.error().message());
                return;
            }
            std::this_thread::sleep_for(interval);
        }
        auto completed = inlet.complete();
        if (!completed) {
            spdlog::warn("Completion rejected: {}", completed.error().message());
        }
    });

    // Raw consumer on the main thread
    std::uint64_t raw_count = 0;
    std::uint64_t raw_gaps = 0;
    while (true) {
        auto delivery = raw.next();
        if (delivery.is_element()) {
            if (++raw_count % 50 == 0) {
                spdlog::info("Reading {}: {:.2f}", delivery.value().seq, delivery.value().value);
            }
        } else if (delivery.is_dropped()) {
            raw_gaps += delivery.dropped_count();
        } else {
            break;
        }
    }

    producer.join();
    ingest_thread.join();
    smoothed_thread.join();

    spdlog::info("Raw consumer: {} readings, {} dropped", raw_count, raw_gaps);
    spdlog::info("Smoothed: {} values from {} transform runs, peak {:.2f}",
        smoothed_count, smoothed.invocations(), peak);
    spdlog::info("{}", relay_ingest::format_report(report));
    spdlog::info("{}", relay_hub::format_stats(sensor.stats()));

    sensor.shutdown();
    return report.ok() ? EXIT_SUCCESS : EXIT_FAILURE;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }
}
