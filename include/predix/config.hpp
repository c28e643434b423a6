#ifndef PREDIX_CONFIG_HPP
#define PREDIX_CONFIG_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace predix {

// Out-of-range configuration value
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Engine Configuration
// Caps applied at market creation and the settlement accounts.
// =============================================================================

struct EngineConfig {
    // Fee caps (bps)
    uint16_t max_creator_fee_bps = 1000;
    uint16_t max_platform_fee_bps = 500;
    uint16_t max_lp_fee_bps = 1000;
    uint16_t default_lp_fee_bps = 30;       // For markets that set no LP fee

    // Market horizon: deadline - creation in [min, max]
    Timestamp min_market_duration = 0;
    Timestamp max_market_duration = 365 * 24 * 60 * 60;

    // String bounds
    size_t max_title_length = 128;
    size_t max_description_length = 512;
    size_t max_category_length = 32;
    size_t max_resolution_source_length = 128;
    size_t max_outcome_label_length = 50;
    size_t max_resolution_data_length = 256;

    // Outcome count bounds
    size_t min_outcomes = 2;
    size_t max_outcomes = 10;

    // AMM
    uint64_t minimum_liquidity = 1000;
    bool refund_excess_liquidity = false;

    // Seconds after resolution during which claims are held (0 = none)
    Timestamp dispute_period = 0;

    // Authorities and accounts. A zero admin disables pause/unpause; the
    // fee recipient is required.
    Address admin{};
    Address protocol_fee_recipient{};

    std::string log_level = "info";

    // Throws ConfigError when a value is out of range
    void validate() const;

    static EngineConfig from_json(const nlohmann::json& j);
    static EngineConfig from_string(std::string_view content);
    static EngineConfig from_file(std::string_view path);
    nlohmann::json to_json() const;
};

} // namespace predix

#endif // PREDIX_CONFIG_HPP
