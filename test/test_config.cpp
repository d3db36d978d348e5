// flash - Config and logging tests

#include <catch2/catch.hpp>
#include <flash/config.hpp>
#include <flash/log.hpp>

#include <sstream>

using namespace flash;

TEST_CASE("Config defaults and overrides", "[config]") {
    SECTION("Empty object keeps defaults") {
        Config config = Config::from_json("{}");
        REQUIRE(config.log_level == "info");
        REQUIRE(config.max_lock_depth == 0);
        REQUIRE(config.manager_address == addresses::FLASH_MANAGER);
    }

    SECTION("From file") {
        Config config = Config::from_file(FLASH_TEST_DATA_DIR "/config.json");
        REQUIRE(config.log_level == "warn");
        REQUIRE(config.max_lock_depth == 8);
        REQUIRE(config.manager_address == addresses::from_lp(0x90ff));
    }
}

TEST_CASE("Config rejects invalid input", "[config]") {
    REQUIRE_THROWS_AS(Config::from_json("{"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json("[]"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"log_level": "loud"})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"max_lock_depth": -1})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"max_lock_depth": "deep"})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"manager_address": "0xnothex"})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_file("/nonexistent/flash.json"), ConfigError);
}

TEST_CASE("Log level filtering", "[config][log]") {
    std::ostringstream out;
    log::set_sink(&out);

    Config config = Config::from_json(R"({"log_level": "warn"})");
    config.apply_logging();
    REQUIRE(log::level() == log::Level::WARN);

    FLASH_LOG_INFO("test", "hidden");
    FLASH_LOG_WARN("test", "shown " << 42);

    std::string text = out.str();
    REQUIRE(text.find("hidden") == std::string::npos);
    REQUIRE(text.find("[warn] test: shown 42") != std::string::npos);

    log::set_sink(nullptr);
    log::set_level(log::Level::INFO);
}
