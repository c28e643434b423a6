// predix - Configuration Tests

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include "predix/config.hpp"

using namespace predix;

TEST_CASE("Config defaults", "[config]") {
    EngineConfig config;

    REQUIRE(config.max_creator_fee_bps == 1000);
    REQUIRE(config.max_platform_fee_bps == 500);
    REQUIRE(config.max_lp_fee_bps == 1000);
    REQUIRE(config.max_market_duration == 365 * 24 * 60 * 60);
    REQUIRE(config.max_title_length == 128);
    REQUIRE(config.max_outcomes == 10);
    REQUIRE(config.minimum_liquidity == 1000);
    REQUIRE_FALSE(config.refund_excess_liquidity);
    REQUIRE(config.dispute_period == 0);
    REQUIRE(config.min_market_duration == 0);
    REQUIRE(config.default_lp_fee_bps == 30);

    // Fee recipient has no default
    REQUIRE_THROWS_AS(config.validate(), ConfigError);
    config.protocol_fee_recipient[19] = 0x01;
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Config from JSON", "[config]") {
    SECTION("Partial override keeps defaults") {
        auto config = EngineConfig::from_string(R"({
            "amm": {"refund_excess_liquidity": true},
            "settlement": {
                "dispute_period": 3600,
                "admin": "0x00000000000000000000000000000000000000aa",
                "protocol_fee_recipient": "0x00000000000000000000000000000000000000bb"
            },
            "log_level": "debug"
        })");

        REQUIRE(config.refund_excess_liquidity);
        REQUIRE(config.dispute_period == 3600);
        REQUIRE(config.admin[19] == 0xaa);
        REQUIRE(config.protocol_fee_recipient[19] == 0xbb);
        REQUIRE(config.log_level == "debug");
        REQUIRE(config.max_platform_fee_bps == 500);
    }

    SECTION("Round trip") {
        EngineConfig saved;
        saved.max_outcomes = 6;
        saved.minimum_liquidity = 500;
        saved.min_market_duration = 3600;
        saved.protocol_fee_recipient[0] = 0x42;

        auto loaded = EngineConfig::from_json(saved.to_json());
        REQUIRE(loaded.max_outcomes == 6);
        REQUIRE(loaded.minimum_liquidity == 500);
        REQUIRE(loaded.min_market_duration == 3600);
        REQUIRE(loaded.protocol_fee_recipient == saved.protocol_fee_recipient);
        REQUIRE(loaded.to_json() == saved.to_json());
    }
}

TEST_CASE("Config validation", "[config]") {
    SECTION("Fee cap above 100%") {
        REQUIRE_THROWS_AS(EngineConfig::from_string(R"({"fees": {"max_lp_fee_bps": 20000}})"),
                          ConfigError);
    }

    SECTION("Too few outcomes") {
        REQUIRE_THROWS_AS(EngineConfig::from_string(R"({"limits": {"min_outcomes": 1}})"),
                          ConfigError);
    }

    SECTION("Unknown log level") {
        REQUIRE_THROWS_AS(EngineConfig::from_string(R"({"log_level": "verbose"})"), ConfigError);
    }

    SECTION("Malformed address") {
        REQUIRE_THROWS_AS(EngineConfig::from_string(R"({"settlement": {"admin": "0x1234"}})"),
                          ConfigError);
    }

    SECTION("Missing fee recipient") {
        REQUIRE_THROWS_AS(EngineConfig::from_string(R"({"settlement": {"dispute_period": 60}})"),
                          ConfigError);
        REQUIRE_THROWS_AS(EngineConfig::from_string(R"({"settlement": {
            "protocol_fee_recipient": "0x0000000000000000000000000000000000000000"
        }})"), ConfigError);
    }

    SECTION("Minimum duration above maximum") {
        REQUIRE_THROWS_AS(EngineConfig::from_string(R"({
            "limits": {"min_market_duration": 7200, "max_market_duration": 3600},
            "settlement": {"protocol_fee_recipient": "0x00000000000000000000000000000000000000bb"}
        })"), ConfigError);
    }

    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(EngineConfig::from_string("{not json"), nlohmann::json::parse_error);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(EngineConfig::from_file("/nonexistent/predix.json"), std::runtime_error);
    }
}
