// =============================================================================
// market.cpp - Market lifecycle state machine
// =============================================================================

#include "predix/market.hpp"

namespace predix {

const char* to_string(MarketStatus status) {
    switch (status) {
        case MarketStatus::ACTIVE:    return "active";
        case MarketStatus::PAUSED:    return "paused";
        case MarketStatus::RESOLVED:  return "resolved";
        case MarketStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::optional<MarketStatus> market_status_from_string(std::string_view s) {
    if (s == "active")    return MarketStatus::ACTIVE;
    if (s == "paused")    return MarketStatus::PAUSED;
    if (s == "resolved")  return MarketStatus::RESOLVED;
    if (s == "cancelled") return MarketStatus::CANCELLED;
    return std::nullopt;
}

uint64_t Market::opposing_pool(uint8_t outcome) const {
    uint64_t sum = 0;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (i != outcome) sum += outcomes[i].total_amount;
    }
    return sum;
}

namespace market {

int32_t validate(const MarketParams& params, const EngineConfig& config, Timestamp now) {
    if (params.title.size() > config.max_title_length) {
        return errors::MARKET_TITLE_TOO_LONG;
    }
    if (params.description.size() > config.max_description_length) {
        return errors::MARKET_DESCRIPTION_TOO_LONG;
    }
    if (params.category.size() > config.max_category_length) {
        return errors::CATEGORY_TOO_LONG;
    }
    if (params.resolution_source.size() > config.max_resolution_source_length) {
        return errors::RESOLUTION_SOURCE_TOO_LONG;
    }
    if (params.outcomes.size() < config.min_outcomes ||
        params.outcomes.size() > config.max_outcomes) {
        return errors::INVALID_OUTCOME_COUNT;
    }
    for (const auto& label : params.outcomes) {
        if (label.empty() || label.size() > config.max_outcome_label_length) {
            return errors::OUTCOME_LABEL_TOO_LONG;
        }
    }

    // Fees
    if (params.creator_fee_bps > config.max_creator_fee_bps ||
        params.platform_fee_bps > config.max_platform_fee_bps ||
        params.lp_fee_bps.value_or(config.default_lp_fee_bps) > config.max_lp_fee_bps) {
        return errors::INVALID_CONFIGURATION;
    }

    // Deadline in (now, now + horizon], at least min_market_duration away
    if (params.resolution_deadline <= now ||
        params.resolution_deadline - now < config.min_market_duration ||
        params.resolution_deadline - now > config.max_market_duration) {
        return errors::INVALID_CONFIGURATION;
    }

    // Bet bounds
    if (params.max_bet == 0 || params.min_bet > params.max_bet) {
        return errors::INVALID_CONFIGURATION;
    }

    if (is_zero_address(params.oracle)) {
        return errors::INVALID_CONFIGURATION;
    }

    return errors::OK;
}

Market make(const Address& creator, const MarketParams& params, const EngineConfig& config,
            Timestamp now) {
    Market m;
    m.market_id = params.market_id;
    m.creator = creator;
    m.oracle = params.oracle;
    m.collateral = params.collateral;
    m.title = params.title;
    m.description = params.description;
    m.category = params.category;
    m.resolution_source = params.resolution_source;
    m.created_at = now;
    m.resolution_deadline = params.resolution_deadline;
    m.status = MarketStatus::ACTIVE;

    m.outcomes.reserve(params.outcomes.size());
    for (const auto& label : params.outcomes) {
        OutcomeState o;
        o.label = label;
        m.outcomes.push_back(std::move(o));
    }

    m.creator_fee_bps = params.creator_fee_bps;
    m.platform_fee_bps = params.platform_fee_bps;
    m.lp_fee_bps = params.lp_fee_bps.value_or(config.default_lp_fee_bps);
    m.min_bet = params.min_bet;
    m.max_bet = params.max_bet;
    m.max_payout_per_bet = params.max_payout_per_bet;
    return m;
}

int32_t pause(Market& m) {
    if (m.status != MarketStatus::ACTIVE) {
        return errors::MARKET_NOT_ACTIVE;
    }
    m.status = MarketStatus::PAUSED;
    return errors::OK;
}

int32_t unpause(Market& m) {
    if (m.status != MarketStatus::PAUSED) {
        return errors::MARKET_NOT_PAUSED;
    }
    m.status = MarketStatus::ACTIVE;
    return errors::OK;
}

int32_t cancel(Market& m, Timestamp now) {
    if (m.status != MarketStatus::ACTIVE) {
        return errors::MARKET_NOT_ACTIVE;
    }
    if (m.expired(now)) {
        return errors::MARKET_EXPIRED;
    }
    m.status = MarketStatus::CANCELLED;
    return errors::OK;
}

int32_t check_resolve(const Market& m, uint8_t outcome, size_t evidence_size,
                      const EngineConfig& config, Timestamp now) {
    if (m.status != MarketStatus::ACTIVE) {
        return errors::MARKET_NOT_ACTIVE;
    }
    if (!m.expired(now)) {
        return errors::MARKET_NOT_EXPIRED;
    }
    if (!m.has_outcome(outcome)) {
        return errors::INVALID_OUTCOME;
    }
    if (evidence_size > config.max_resolution_data_length) {
        return errors::RESOLUTION_DATA_TOO_LARGE;
    }
    return errors::OK;
}

int32_t check_open(const Market& m, Timestamp now) {
    if (m.status != MarketStatus::ACTIVE) {
        return errors::MARKET_NOT_ACTIVE;
    }
    if (m.expired(now)) {
        return errors::MARKET_EXPIRED;
    }
    return errors::OK;
}

} // namespace market

} // namespace predix
