#ifndef BONDING_TEST_FIXTURES_HPP
#define BONDING_TEST_FIXTURES_HPP

#include "bonding/bonding.hpp"

namespace bonding::test {

constexpr Address ALICE = addresses::from_id(0xA11C);
constexpr Address BOB = addresses::from_id(0x0B0B);

inline I128 tokens(int64_t whole) { return x18::from_int(whole); }

// Settable clock shared with a Market
struct ManualClock {
    uint64_t now = 1700000000;

    Clock fn() { return [this] { return now; }; }
};

inline Market::Options options_at(ManualClock& clock, I128 feed_answer_8dp = static_cast<I128>(3000) * 100000000) {
    Market::Options options;
    options.feed_answer = feed_answer_8dp;
    options.clock = clock.fn();
    return options;
}

// $1 oracle, price 1 unit per settlement base unit until the threshold:
// 1000 supply, 800 threshold, $500 target, 200 units + 5 + 1 deployment.
inline CurveConfig flat_config() {
    CurveConfig cfg;
    cfg.total_supply = tokens(1000);
    cfg.sale_threshold = tokens(800);
    cfg.raise_target_usd_x18 = tokens(500);
    cfg.initial_multiplier = 1;
    cfg.final_multiplier = 2;
    cfg.price_normalizer_x18 = X18_ONE;
    cfg.price_precision = 1;
    cfg.deploy_units = tokens(200);
    cfg.deploy_settlement = tokens(5);
    cfg.deploy_fee_settlement = tokens(1);
    return cfg;
}

constexpr I128 ONE_DOLLAR_8DP = 100000000;

} // namespace bonding::test

#endif // BONDING_TEST_FIXTURES_HPP
