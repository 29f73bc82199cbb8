#ifndef BONDING_CONFIG_HPP
#define BONDING_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "types.hpp"

namespace bonding {

// Upper bound for the trading fee, in whole percent
constexpr uint32_t MAX_FEE_PERCENT = 10;

// Which settlement value counts toward the raise target
enum class RaiseAccounting : uint8_t {
    GROSS = 0,   // Full inbound settlement, fee included
    NET = 1      // Settlement after the trading fee
};

// =============================================================================
// Curve Configuration
// =============================================================================

// Amounts of the issued asset and of the settlement asset carry 18 decimals.
// Prices are integers in units of 1 / price_precision reference currency.
struct CurveConfig {
    I128 total_supply = static_cast<I128>(1000000000) * X18_ONE;       // 1B units
    I128 sale_threshold = static_cast<I128>(800000000) * X18_ONE;      // 800M units
    I128 raise_target_usd_x18 = static_cast<I128>(18000) * X18_ONE;    // $18,000

    // initial/final price = multiplier * oracle_price_x18 / price_normalizer_x18
    I128 initial_multiplier = 7;
    I128 final_multiplier = 75;
    I128 price_normalizer_x18 = static_cast<I128>(3000) * X18_ONE;
    I128 price_precision = 1000000;                                     // 1e6

    uint32_t fee_percent = 1;

    // Fixed liquidity deployment split
    I128 deploy_units = static_cast<I128>(200000000) * X18_ONE;        // 200M units
    I128 deploy_settlement = 5 * X18_ONE;                              // to the venue
    I128 deploy_fee_settlement = 1 * X18_ONE;                          // to the fee sink

    uint64_t update_interval = 3600;                                    // seconds

    Address fee_collector{};
    Address liquidity_collector{};

    bool clamp_price_at_threshold = false;
    RaiseAccounting raise_accounting = RaiseAccounting::GROSS;

    // errors::OK or errors::INVALID_CONFIG
    int32_t validate() const;

    // Load from a JSON document / file. Missing keys keep their defaults;
    // malformed values throw std::invalid_argument, unreadable files
    // std::runtime_error.
    static CurveConfig from_json(std::string_view content);
    static CurveConfig from_file(std::string_view path);

    std::string to_json() const;
};

} // namespace bonding

#endif // BONDING_CONFIG_HPP
