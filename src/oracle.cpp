// =============================================================================
// oracle.cpp - Reference price ingestion and caching
// =============================================================================

#include "bonding/oracle.hpp"

namespace bonding {

std::optional<FeedRound> StaticPriceFeed::latest_round() const {
    ++reads_;
    if (!available_) return std::nullopt;
    return FeedRound{answer_, updated_at_};
}

OracleCache::OracleCache(const IPriceFeed& feed, uint64_t update_interval)
    : feed_(feed), update_interval_(update_interval) {}

bool OracleCache::is_stale(uint64_t now) const {
    if (cache_.price_x18 <= 0) return true;
    if (now < cache_.last_refresh) return false;
    return now - cache_.last_refresh >= update_interval_;
}

OracleReading OracleCache::read_feed() const {
    auto round = feed_.latest_round();
    if (!round) {
        return {errors::ORACLE_SOURCE_UNAVAILABLE, 0, 0, false};
    }
    if (round->answer <= 0) {
        return {errors::INVALID_PRICE, 0, round->updated_at, false};
    }

    // Scale to 18 decimals on ingestion
    uint8_t decimals = feed_.decimals();
    I128 price_x18 = round->answer;
    if (decimals < 18) {
        auto scaled = math::mul_div(round->answer, math::pow10(18 - decimals), 1);
        if (!scaled) return {errors::ARITHMETIC_OVERFLOW, 0, round->updated_at, false};
        price_x18 = *scaled;
    } else if (decimals > 18) {
        price_x18 = round->answer / math::pow10(decimals - 18);
        if (price_x18 <= 0) return {errors::INVALID_PRICE, 0, round->updated_at, false};
    }

    return {errors::OK, price_x18, round->updated_at, false};
}

OracleReading OracleCache::refresh(uint64_t now) {
    OracleReading reading = read_feed();
    if (reading.status != errors::OK) return reading;

    cache_.price_x18 = reading.price_x18;
    cache_.last_refresh = now;
    reading.as_of = now;
    reading.refreshed = true;
    return reading;
}

OracleReading OracleCache::refresh_if_stale(uint64_t now) {
    if (is_stale(now)) return refresh(now);
    return {errors::OK, cache_.price_x18, cache_.last_refresh, false};
}

OracleReading OracleCache::current_price(uint64_t now) const {
    if (!is_stale(now)) {
        return {errors::OK, cache_.price_x18, cache_.last_refresh, false};
    }
    return read_feed();
}

} // namespace bonding
