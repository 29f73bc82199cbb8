// =============================================================================
// market.cpp - In-memory curve deployment wiring
// =============================================================================

#include "bonding/market.hpp"

#include <stdexcept>

namespace bonding {

namespace {

CurveConfig with_default_collectors(CurveConfig config) {
    if (addresses::is_zero(config.fee_collector)) {
        config.fee_collector = accounts::FEE_COLLECTOR;
    }
    if (addresses::is_zero(config.liquidity_collector)) {
        config.liquidity_collector = accounts::LIQUIDITY_COLLECTOR;
    }
    return config;
}

} // namespace

Market::Market(CurveConfig config)
    : Market(std::move(config), Options{}) {}

Market::Market(CurveConfig config, Options options)
    : asset_(accounts::TOKEN, options.token_name, options.token_symbol, accounts::CURVE)
    , feed_(options.feed_decimals, options.feed_answer)
    , sink_(accounts::SINK, accounts::VENUE, asset_, value_, events_) {
    config = with_default_collectors(std::move(config));
    if (config.validate() != errors::OK) {
        throw std::invalid_argument("invalid curve configuration");
    }

    if (!asset_.mint(accounts::CURVE, accounts::CURVE, config.total_supply)) {
        throw std::invalid_argument("cannot mint curve supply");
    }

    Clock clock = options.clock ? options.clock : Clock(system_seconds);
    sink_.set_authorized_caller(accounts::CURVE);
    sink_.set_clock(clock);

    ctx_.enlist(&value_);
    ctx_.enlist(&asset_);
    ctx_.enlist(&events_);
    ctx_.enlist(&sink_);

    CurveCollaborators collaborators{asset_, value_, feed_, sink_, events_};
    engine_ = std::make_unique<CurveEngine>(accounts::CURVE, config, collaborators, ctx_, clock);
}

} // namespace bonding
