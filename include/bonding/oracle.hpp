#ifndef BONDING_ORACLE_HPP
#define BONDING_ORACLE_HPP

#include <cstdint>
#include <optional>
#include <functional>

#include "types.hpp"

namespace bonding {

// =============================================================================
// Price Feed Interface (Chainlink-style aggregator)
// =============================================================================

struct FeedRound {
    I128 answer;          // Raw answer, scaled by 10^decimals()
    uint64_t updated_at;  // Unix seconds
};

class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    virtual uint8_t decimals() const = 0;

    // nullopt when the source cannot answer at all
    virtual std::optional<FeedRound> latest_round() const = 0;
};

// Settable feed (mock aggregator)
class StaticPriceFeed : public IPriceFeed {
public:
    StaticPriceFeed(uint8_t decimals, I128 answer, uint64_t updated_at = 0)
        : decimals_(decimals), answer_(answer), updated_at_(updated_at), available_(true) {}

    uint8_t decimals() const override { return decimals_; }
    std::optional<FeedRound> latest_round() const override;

    void set_answer(I128 answer, uint64_t updated_at = 0) {
        answer_ = answer;
        updated_at_ = updated_at;
    }
    void set_available(bool available) { available_ = available; }

    uint64_t reads() const { return reads_; }

private:
    uint8_t decimals_;
    I128 answer_;
    uint64_t updated_at_;
    bool available_;
    mutable uint64_t reads_{0};
};

// =============================================================================
// Price Cache
// =============================================================================

struct PriceCache {
    I128 price_x18;         // 0 = never refreshed
    uint64_t last_refresh;

    bool operator==(const PriceCache& other) const {
        return price_x18 == other.price_x18 && last_refresh == other.last_refresh;
    }
    bool operator!=(const PriceCache& other) const { return !(*this == other); }
};

struct OracleReading {
    int32_t status;     // errors::OK or an oracle fault
    I128 price_x18;
    uint64_t as_of;     // Cache time (refresh) or feed time (on-demand read)
    bool refreshed;     // The cache was written by this call
};

// =============================================================================
// OracleCache - Reference price with time-window caching
// =============================================================================

class OracleCache {
public:
    OracleCache(const IPriceFeed& feed, uint64_t update_interval);

    // Read the feed and overwrite the cache. Fails with INVALID_PRICE on a
    // non-positive answer and ORACLE_SOURCE_UNAVAILABLE when the feed is
    // silent; the cache is untouched on failure.
    OracleReading refresh(uint64_t now);

    // refresh() only when the cache is stale, otherwise the cached value
    OracleReading refresh_if_stale(uint64_t now);

    // Cached price when fresh, otherwise an on-demand feed read that leaves
    // the cache as it is
    OracleReading current_price(uint64_t now) const;

    bool is_stale(uint64_t now) const;

    const PriceCache& cache() const { return cache_; }
    void restore(const PriceCache& cache) { cache_ = cache; }

    uint64_t update_interval() const { return update_interval_; }
    void set_update_interval(uint64_t interval) { update_interval_ = interval; }

private:
    const IPriceFeed& feed_;
    uint64_t update_interval_;
    PriceCache cache_{0, 0};

    OracleReading read_feed() const;
};

} // namespace bonding

#endif // BONDING_ORACLE_HPP
