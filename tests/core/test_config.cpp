// relay_core layered configuration tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <relay/core/config.hpp>
#include <relay/core/log.hpp>
#include <relay/hub/types.hpp>
#include <relay/ingest/types.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace relay_core;

TEST_CASE("ConfigManager: defaults", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();

    REQUIRE(config.layer_count() == 6);
    REQUIRE(config.get_string(config_keys::HUB_NAME) == "hub");
    REQUIRE(config.get_string(config_keys::HUB_OVERFLOW_POLICY) == "drop_oldest");
    REQUIRE(config.get_int(config_keys::HUB_BUFFER_CAPACITY) == 1024);
    REQUIRE(config.get_bool(config_keys::HUB_KEEP_ALIVE));
    REQUIRE(config.get_int(config_keys::INGEST_BATCH_SIZE) == 100);
    REQUIRE(config.get_float(config_keys::INGEST_BACKOFF_MULTIPLIER) == Catch::Approx(2.0));
}

TEST_CASE("ConfigManager: layer priority", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();

    config.set_int("hub.buffer_capacity", 64, "project");
    REQUIRE(config.get_int("hub.buffer_capacity") == 64);

    config.set_int("hub.buffer_capacity", 32, "user");
    REQUIRE(config.get_int("hub.buffer_capacity") == 32);

    auto parsed = config.parse_args(std::vector<std::string>{"--hub.buffer_capacity=8"});
    REQUIRE(parsed.is_ok());
    REQUIRE(config.get_int("hub.buffer_capacity") == 8);

    REQUIRE(config.remove_layer("cmdline"));
    REQUIRE(config.get_int("hub.buffer_capacity") == 32);
}

TEST_CASE("ConfigManager: typed getters convert", "[core][config]") {
    ConfigManager config;
    config.set_string("a.flag", "yes");
    config.set_string("a.count", "17");
    config.set_int("a.ratio", 3);
    config.set_float("a.real", 2.5);

    REQUIRE(config.get_bool("a.flag"));
    REQUIRE(config.get_int("a.count") == 17);
    REQUIRE(config.get_float("a.ratio") == Catch::Approx(3.0));
    REQUIRE(config.get_int("a.real") == 2);
    REQUIRE(config.get_string("a.ratio") == "3");
    REQUIRE(config.get_int("a.missing", 99) == 99);
    REQUIRE(config.get_or<std::string>("a.flag", "no") == "yes");
}

TEST_CASE("ConfigManager: parse_args", "[core][config]") {
    ConfigManager config;

    SECTION("forms and types") {
        auto result = config.parse_args(std::vector<std::string>{
            "--hub-buffer_capacity=64",
            "--hub.dispatch_mode", "worker",
            "--hub-keep_alive",
            "--ingest.backoff_multiplier=1.5",
        });
        REQUIRE(result.is_ok());
        REQUIRE(config.get_int("hub.buffer_capacity") == 64);
        REQUIRE(config.get_string("hub.dispatch_mode") == "worker");
        REQUIRE(config.get_bool("hub.keep_alive"));
        REQUIRE(config.get_float("ingest.backoff_multiplier") == Catch::Approx(1.5));
    }

    SECTION("positional argument is rejected") {
        auto result = config.parse_args(std::vector<std::string>{"stray"});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("ConfigManager: load_json_string flattens objects", "[core][config]") {
    ConfigManager config;
    config.create_default_layers();

    auto result = config.load_json_string(R"({
        "hub": { "name": "ticks", "buffer_capacity": 16, "keep_alive": false },
        "ingest": { "backoff_multiplier": 3.0 },
        "tags": ["a", "b"]
    })", "project");

    REQUIRE(result.is_ok());
    REQUIRE(config.get_string("hub.name") == "ticks");
    REQUIRE(config.get_int("hub.buffer_capacity") == 16);
    REQUIRE_FALSE(config.get_bool("hub.keep_alive", true));
    REQUIRE(config.get_float("ingest.backoff_multiplier") == Catch::Approx(3.0));
    REQUIRE(config.get_string_array("tags") == std::vector<std::string>{"a", "b"});
}

TEST_CASE("ConfigManager: load_json_string errors", "[core][config]") {
    ConfigManager config;

    SECTION("malformed") {
        auto result = config.load_json_string("{ not json", "user");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("root must be an object") {
        auto result = config.load_json_string("[1, 2]", "user");
        REQUIRE(result.is_err());
    }

    SECTION("bad document leaves layer untouched") {
        config.set_int("hub.buffer_capacity", 5, "user");
        auto result = config.load_json_string(R"({"hub": {"buffer_capacity": 9, "tags": [1]}})", "user");
        REQUIRE(result.is_err());
        REQUIRE(config.get_int("hub.buffer_capacity") == 5);
    }

    SECTION("missing file") {
        auto result = config.load_json("/nonexistent/relay.json", "user");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::IOError);
    }
}

TEST_CASE("ConfigManager: save_json round trip through a file", "[core][config]") {
    auto path = std::filesystem::temp_directory_path() / "relay_test_config.json";

    ConfigManager source;
    source.set_string("hub.name", "saved");
    source.set_int("hub.buffer_capacity", 12);
    REQUIRE(source.save_json(path, "user").is_ok());

    ConfigManager loaded;
    REQUIRE(loaded.load_json(path, "user").is_ok());
    REQUIRE(loaded.get_string("hub.name") == "saved");
    REQUIRE(loaded.get_int("hub.buffer_capacity") == 12);

    std::filesystem::remove(path);
}

TEST_CASE("ConfigManager: environment", "[core][config]") {
    ::setenv("RELAYTEST_HUB_OVERFLOW_POLICY", "fail_fast", 1);
    ::setenv("RELAYTEST_INGEST_BATCH_SIZE", "250", 1);

    ConfigManager config;
    config.setup_defaults();
    config.load_environment("RELAYTEST_");

    REQUIRE(config.get_string("hub.overflow_policy") == "fail_fast");
    REQUIRE(config.get_int("ingest.batch_size") == 250);

    ::unsetenv("RELAYTEST_HUB_OVERFLOW_POLICY");
    ::unsetenv("RELAYTEST_INGEST_BATCH_SIZE");
}

TEST_CASE("ConfigManager: change callbacks", "[core][config]") {
    ConfigManager config;
    std::vector<std::string> changed;
    config.on_change([&changed](const std::string& key, const ConfigValue&) {
        changed.push_back(key);
    });

    config.set_int("hub.buffer_capacity", 4);
    REQUIRE(config.parse_args(std::vector<std::string>{"--log.level=debug"}).is_ok());

    REQUIRE(changed == std::vector<std::string>{"hub.buffer_capacity", "log.level"});
}

// =============================================================================
// Config binding
// =============================================================================

TEST_CASE("hub_config_from", "[core][config][hub]") {
    ConfigManager config;
    config.setup_defaults();

    SECTION("defaults") {
        auto hub = relay_hub::hub_config_from(config);
        REQUIRE(hub.is_ok());
        REQUIRE(hub->overflow == relay_hub::OverflowPolicy::DropOldest);
        REQUIRE(hub->buffer_capacity == 1024);
        REQUIRE(hub->dispatch == relay_hub::DispatchMode::Inline);
        REQUIRE(hub->keep_alive);
    }

    SECTION("overrides") {
        config.set_string("hub.overflow_policy", "drop_newest");
        config.set_int("hub.buffer_capacity", 3);
        config.set_string("hub.dispatch_mode", "worker");
        auto hub = relay_hub::hub_config_from(config);
        REQUIRE(hub.is_ok());
        REQUIRE(hub->overflow == relay_hub::OverflowPolicy::DropNewest);
        REQUIRE(hub->buffer_capacity == 3);
        REQUIRE(hub->dispatch == relay_hub::DispatchMode::Worker);
    }

    SECTION("unknown policy") {
        config.set_string("hub.overflow_policy", "drop_everything");
        auto hub = relay_hub::hub_config_from(config);
        REQUIRE(hub.is_err());
        REQUIRE(hub.error().code() == ErrorCode::ValidationError);
    }

    SECTION("zero capacity") {
        config.set_int("hub.buffer_capacity", 0);
        REQUIRE(relay_hub::hub_config_from(config).is_err());
    }

    SECTION("block_producer with worker") {
        config.set_string("hub.overflow_policy", "block_producer");
        config.set_string("hub.dispatch_mode", "worker");
        REQUIRE(relay_hub::hub_config_from(config).is_err());
    }

    SECTION("custom prefix") {
        config.set_string("derived.name", "averages", "project");
        auto hub = relay_hub::hub_config_from(config, "derived");
        REQUIRE(hub.is_ok());
        REQUIRE(hub->name == "averages");
    }
}

TEST_CASE("ingest_config_from", "[core][config][ingest]") {
    ConfigManager config;
    config.setup_defaults();

    auto ingest = relay_ingest::ingest_config_from(config);
    REQUIRE(ingest.is_ok());
    REQUIRE(ingest->batch_size == 100);
    REQUIRE(ingest->max_retries == 5);
    REQUIRE(ingest->base_backoff.count() == 50);
    REQUIRE(ingest->max_backoff.count() == 2000);

    config.set_int("ingest.batch_size", 0);
    REQUIRE(relay_ingest::ingest_config_from(config).is_err());
}

TEST_CASE("log_config_from", "[core][config][log]") {
    ConfigManager config;
    config.setup_defaults();
    config.set_string("log.level", "warn");

    auto log = log_config_from(config);
    REQUIRE(log.is_ok());
    REQUIRE(log->level == spdlog::level::warn);
    REQUIRE(log->console_enabled);
    REQUIRE_FALSE(log->file_enabled);

    REQUIRE(log->logger_levels.empty());

    config.set_string("log.hub_level", "debug");
    auto tuned = log_config_from(config);
    REQUIRE(tuned.is_ok());
    REQUIRE(tuned->logger_levels.at(logger_names::HUB) == spdlog::level::debug);
    REQUIRE(tuned->logger_levels.count(logger_names::INGEST) == 0);

    config.set_string("log.ingest_level", "loud");
    REQUIRE(log_config_from(config).is_err());
    config.set_string("log.ingest_level", "warn");

    config.set_string("log.level", "chatty");
    auto bad = log_config_from(config);
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code() == ErrorCode::ValidationError);
}
