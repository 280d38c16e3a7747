#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <string>

#include "sase/diagnostics.hpp"

static void set_env_var(const char* name, const char* value) {
#if defined(_WIN32)
    _putenv_s(name, value ? value : "");
#else
    if (value) setenv(name, value, 1); else unsetenv(name);
#endif
}

TEST_CASE("log level names", "[config][diagnostics]") {
    REQUIRE(sase::parse_log_level("debug").value() == spdlog::level::debug);
    REQUIRE(sase::parse_log_level("error").value() == spdlog::level::err);
    REQUIRE(sase::parse_log_level("off").value() == spdlog::level::off);

    auto bad = sase::parse_log_level("loud");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == sase::core::error_code::config_invalid);
}

TEST_CASE("diagnostics config comes from the environment", "[config][diagnostics]") {
    set_env_var("SASE_LOG_LEVEL", nullptr);
    set_env_var("SASE_LOG_NAME", nullptr);
    auto defaults = sase::load_diagnostics_config();
    REQUIRE(defaults.has_value());
    REQUIRE(defaults->level == spdlog::level::warn);
    REQUIRE(defaults->logger_name == "sase");

    set_env_var("SASE_LOG_LEVEL", "debug");
    set_env_var("SASE_LOG_NAME", "cep-worker");
    auto cfg = sase::load_diagnostics_config();
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->level == spdlog::level::debug);
    REQUIRE(cfg->logger_name == "cep-worker");

    auto logger = sase::make_diagnostics_logger(*cfg);
    REQUIRE(logger->name() == "cep-worker");
    REQUIRE(logger->level() == spdlog::level::debug);

    set_env_var("SASE_LOG_LEVEL", "verbose");
    auto bad = sase::load_diagnostics_config();
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == sase::core::error_code::config_invalid);

    set_env_var("SASE_LOG_LEVEL", nullptr);
    set_env_var("SASE_LOG_NAME", nullptr);
}

TEST_CASE("empty environment values fall back to defaults", "[config][diagnostics]") {
    set_env_var("SASE_LOG_LEVEL", "error");
    set_env_var("SASE_LOG_NAME", "cep-worker");
    REQUIRE(sase::load_diagnostics_config()->level == spdlog::level::err);

    // an empty value is not an unknown level name
    set_env_var("SASE_LOG_LEVEL", "");
    set_env_var("SASE_LOG_NAME", "");
    auto cfg = sase::load_diagnostics_config();
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->level == spdlog::level::warn);
    REQUIRE(cfg->logger_name == "sase");

    // a set name with an unset level keeps the default level
    set_env_var("SASE_LOG_LEVEL", nullptr);
    set_env_var("SASE_LOG_NAME", "ingest");
    cfg = sase::load_diagnostics_config();
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->level == spdlog::level::warn);
    REQUIRE(cfg->logger_name == "ingest");

    set_env_var("SASE_LOG_NAME", nullptr);
}

TEST_CASE("discard logger is shared and silent", "[diagnostics]") {
    auto a = sase::discard_logger();
    auto b = sase::discard_logger();
    REQUIRE(a == b);
    REQUIRE(a->level() == spdlog::level::off);
}
