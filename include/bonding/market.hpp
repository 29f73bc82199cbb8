#ifndef BONDING_MARKET_HPP
#define BONDING_MARKET_HPP

#include <memory>

#include "types.hpp"
#include "config.hpp"
#include "journal.hpp"
#include "ledger.hpp"
#include "oracle.hpp"
#include "sink.hpp"
#include "events.hpp"
#include "curve.hpp"

namespace bonding {

// =============================================================================
// Well-known simulation accounts
// =============================================================================

namespace accounts {
constexpr Address CURVE = addresses::from_id(0x0C00);
constexpr Address TOKEN = addresses::from_id(0x0A00);
constexpr Address SINK = addresses::from_id(0x0510);
constexpr Address VENUE = addresses::from_id(0x0520);
constexpr Address FEE_COLLECTOR = addresses::from_id(0x0FEE);
constexpr Address LIQUIDITY_COLLECTOR = addresses::from_id(0x01C0);
} // namespace accounts

// =============================================================================
// Market - In-memory curve deployment
//
// Owns the execution context, both ledgers, the price feed, the audit log,
// the pool sink and the engine, wired together and enlisted for rollback.
// The curve account starts with the whole supply minted to it.
// =============================================================================

class Market {
public:
    struct Options {
        uint8_t feed_decimals = 8;
        I128 feed_answer = static_cast<I128>(3000) * 100000000;  // $3000, 8 decimals
        std::string token_name = "Bonding Token";
        std::string token_symbol = "BOND";
        Clock clock = system_seconds;
    };

    // Zero collector addresses in `config` are replaced by the well-known
    // simulation accounts. Throws std::invalid_argument on invalid config.
    explicit Market(CurveConfig config);
    Market(CurveConfig config, Options options);
    ~Market() = default;

    // Non-copyable
    Market(const Market&) = delete;
    Market& operator=(const Market&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    CurveEngine& engine() { return *engine_; }
    const CurveEngine& engine() const { return *engine_; }

    TokenLedger& asset() { return asset_; }
    ValueLedger& value() { return value_; }
    StaticPriceFeed& feed() { return feed_; }
    EventLog& events() { return events_; }
    PoolLiquiditySink& sink() { return sink_; }
    ExecutionContext& context() { return ctx_; }

    // Give an account settlement value to trade with
    void fund(const Address& account, I128 settlement) { value_.credit(account, settlement); }

    // Let the curve pull `units` back from `seller`
    bool approve_curve(const Address& seller, I128 units) {
        return asset_.approve(seller, accounts::CURVE, units);
    }

private:
    ExecutionContext ctx_;
    ValueLedger value_;
    TokenLedger asset_;
    StaticPriceFeed feed_;
    EventLog events_;
    PoolLiquiditySink sink_;
    std::unique_ptr<CurveEngine> engine_;
};

} // namespace bonding

#endif // BONDING_MARKET_HPP
