// relay_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <relay/core/log.hpp>
#include <map>
#include <string>

using namespace relay_core;

TEST_CASE("parse_log_level", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
}

TEST_CASE("log_level_name", "[core][log]") {
    REQUIRE(std::string(log_level_name(spdlog::level::info)) == "info");
    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
}

TEST_CASE("Named loggers are cached", "[core][log]") {
    auto a = get_logger("relay_test");
    auto b = get_logger("relay_test");
    REQUIRE(a == b);
    REQUIRE(hub_logger()->name() == logger_names::HUB);
    REQUIRE(ingest_logger()->name() == "relay_ingest");
    REQUIRE(core_logger()->name() == "relay_core");
}

TEST_CASE("Global log level applies to loggers without an override", "[core][log]") {
    auto previous = get_global_log_level();
    auto plain = get_logger("relay_test_plain");
    auto tuned = get_logger("relay_test_tuned");

    set_logger_level("relay_test_tuned", spdlog::level::debug);
    set_global_log_level(spdlog::level::err);

    REQUIRE(get_global_log_level() == spdlog::level::err);
    REQUIRE(plain->level() == spdlog::level::err);
    REQUIRE(tuned->level() == spdlog::level::debug);
    REQUIRE(effective_log_level("relay_test_tuned") == spdlog::level::debug);
    REQUIRE(effective_log_level("relay_test_unknown") == spdlog::level::err);

    set_global_log_level(previous);
}

TEST_CASE("configure_logging re-targets existing loggers", "[core][log]") {
    auto logger = get_logger("relay_test_configured");

    LogConfig config;
    config.console_enabled = false;
    config.level = spdlog::level::warn;
    config.logger_levels["relay_test_configured"] = spdlog::level::trace;
    configure_logging(config);

    REQUIRE(logger->sinks().empty());
    REQUIRE(logger->level() == spdlog::level::trace);
    REQUIRE(get_logger("relay_test_late")->level() == spdlog::level::warn);

    configure_logging(LogConfig{});
    REQUIRE(logger->sinks().size() == 1);
    REQUIRE(logger->level() == spdlog::level::info);
}

TEST_CASE("format_fields", "[core][log]") {
    REQUIRE(format_fields({}).empty());

    std::map<std::string, std::string> fields{{"hub", "ticks"}, {"id", "3"}};
    REQUIRE(format_fields(fields) == R"( {hub="ticks", id="3"})");
}
