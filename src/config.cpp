// =============================================================================
// config.cpp - EngineConfig loading (JSON)
// =============================================================================

#include "predix/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace predix {

using json = nlohmann::json;

namespace {

Address parse_address(const json& j, const char* key) {
    auto addr = address_from_hex(j.at(key).get<std::string>());
    if (!addr) {
        throw ConfigError(std::string("Invalid address for ") + key);
    }
    return *addr;
}

} // namespace

void EngineConfig::validate() const {
    if (max_creator_fee_bps > BPS_DENOMINATOR ||
        max_platform_fee_bps > BPS_DENOMINATOR ||
        max_lp_fee_bps > BPS_DENOMINATOR) {
        throw ConfigError("Fee caps must not exceed 10000 bps");
    }
    if (default_lp_fee_bps > max_lp_fee_bps) {
        throw ConfigError("default_lp_fee_bps exceeds max_lp_fee_bps");
    }
    if (max_market_duration <= 0) {
        throw ConfigError("max_market_duration must be positive");
    }
    if (min_market_duration < 0 || min_market_duration > max_market_duration) {
        throw ConfigError("min_market_duration must be in [0, max_market_duration]");
    }
    if (min_outcomes < 2 || max_outcomes < min_outcomes || max_outcomes > 255) {
        throw ConfigError("Outcome bounds must satisfy 2 <= min <= max <= 255");
    }
    if (dispute_period < 0) {
        throw ConfigError("dispute_period must not be negative");
    }
    if (log_level != "trace" && log_level != "debug" && log_level != "info" &&
        log_level != "warn" && log_level != "error" && log_level != "off") {
        throw ConfigError("Unknown log_level: " + log_level);
    }
    if (is_zero_address(protocol_fee_recipient)) {
        throw ConfigError("protocol_fee_recipient must be set");
    }
}

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig config;

    if (j.contains("fees")) {
        const auto& f = j.at("fees");
        config.max_creator_fee_bps = f.value("max_creator_fee_bps", config.max_creator_fee_bps);
        config.max_platform_fee_bps = f.value("max_platform_fee_bps", config.max_platform_fee_bps);
        config.max_lp_fee_bps = f.value("max_lp_fee_bps", config.max_lp_fee_bps);
        config.default_lp_fee_bps = f.value("default_lp_fee_bps", config.default_lp_fee_bps);
    }

    if (j.contains("limits")) {
        const auto& l = j.at("limits");
        config.min_market_duration = l.value("min_market_duration", config.min_market_duration);
        config.max_market_duration = l.value("max_market_duration", config.max_market_duration);
        config.max_title_length = l.value("max_title_length", config.max_title_length);
        config.max_description_length = l.value("max_description_length", config.max_description_length);
        config.max_category_length = l.value("max_category_length", config.max_category_length);
        config.max_resolution_source_length =
            l.value("max_resolution_source_length", config.max_resolution_source_length);
        config.max_outcome_label_length = l.value("max_outcome_label_length", config.max_outcome_label_length);
        config.max_resolution_data_length =
            l.value("max_resolution_data_length", config.max_resolution_data_length);
        config.min_outcomes = l.value("min_outcomes", config.min_outcomes);
        config.max_outcomes = l.value("max_outcomes", config.max_outcomes);
    }

    if (j.contains("amm")) {
        const auto& a = j.at("amm");
        config.minimum_liquidity = a.value("minimum_liquidity", config.minimum_liquidity);
        config.refund_excess_liquidity = a.value("refund_excess_liquidity", config.refund_excess_liquidity);
    }

    if (j.contains("settlement")) {
        const auto& s = j.at("settlement");
        config.dispute_period = s.value("dispute_period", config.dispute_period);
        if (s.contains("admin")) config.admin = parse_address(s, "admin");
        if (s.contains("protocol_fee_recipient")) {
            config.protocol_fee_recipient = parse_address(s, "protocol_fee_recipient");
        }
    }

    config.log_level = j.value("log_level", config.log_level);

    config.validate();
    return config;
}

EngineConfig EngineConfig::from_string(std::string_view content) {
    return from_json(json::parse(content));
}

EngineConfig EngineConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

json EngineConfig::to_json() const {
    return json{
        {"fees", {
            {"max_creator_fee_bps", max_creator_fee_bps},
            {"max_platform_fee_bps", max_platform_fee_bps},
            {"max_lp_fee_bps", max_lp_fee_bps},
            {"default_lp_fee_bps", default_lp_fee_bps}
        }},
        {"limits", {
            {"min_market_duration", min_market_duration},
            {"max_market_duration", max_market_duration},
            {"max_title_length", max_title_length},
            {"max_description_length", max_description_length},
            {"max_category_length", max_category_length},
            {"max_resolution_source_length", max_resolution_source_length},
            {"max_outcome_label_length", max_outcome_label_length},
            {"max_resolution_data_length", max_resolution_data_length},
            {"min_outcomes", min_outcomes},
            {"max_outcomes", max_outcomes}
        }},
        {"amm", {
            {"minimum_liquidity", minimum_liquidity},
            {"refund_excess_liquidity", refund_excess_liquidity}
        }},
        {"settlement", {
            {"dispute_period", dispute_period},
            {"admin", to_hex(admin)},
            {"protocol_fee_recipient", to_hex(protocol_fee_recipient)}
        }},
        {"log_level", log_level}
    };
}

} // namespace predix
