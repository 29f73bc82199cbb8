#ifndef BONDING_CURVE_HPP
#define BONDING_CURVE_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "types.hpp"
#include "config.hpp"
#include "journal.hpp"
#include "ledger.hpp"
#include "oracle.hpp"
#include "sink.hpp"
#include "events.hpp"

namespace bonding {

// =============================================================================
// Curve State
// =============================================================================

struct CurveState {
    I128 unsold_inventory;   // Units of the issued asset still for sale
    I128 raised_usd_x18;     // Cumulative reference-currency value raised
    bool liquidity_deployed; // One-way latch

    bool operator==(const CurveState& other) const {
        return unsold_inventory == other.unsold_inventory &&
               raised_usd_x18 == other.raised_usd_x18 &&
               liquidity_deployed == other.liquidity_deployed;
    }
    bool operator!=(const CurveState& other) const { return !(*this == other); }
};

// =============================================================================
// Operation Results
// =============================================================================

struct QuoteResult {
    int32_t status;   // errors::OK or failure code
    I128 amount;      // Units (buy quote), settlement (sell quote), price or USD
    I128 price;       // Curve price the quote was taken at

    bool ok() const { return status == errors::OK; }
};

struct BuyResult {
    int32_t status;
    I128 units_out;           // Delivered to the beneficiary
    I128 fee;                 // Settlement sent to the fee collector
    I128 price;               // Curve price before the purchase
    bool deployed_liquidity;  // This purchase triggered deployment
    std::string sink_reason;  // Sink failure reason when status is LIQUIDITY_SINK_FAILED

    bool ok() const { return status == errors::OK; }
};

struct SellResult {
    int32_t status;
    I128 settlement_out;      // Gross value of the units sold
    I128 fee;                 // Deducted from settlement_out
    I128 net_out;             // settlement_out - fee, paid to the seller
    I128 price;

    bool ok() const { return status == errors::OK; }
};

// =============================================================================
// Admin Capability
// =============================================================================

// Proof of administrative authority over one engine. Handed out once.
class AdminCapability {
public:
    uint64_t engine_id() const { return engine_id_; }

private:
    friend class CurveEngine;
    explicit AdminCapability(uint64_t engine_id) : engine_id_(engine_id) {}

    uint64_t engine_id_;
};

// Collaborators the engine calls into. All must outlive the engine.
struct CurveCollaborators {
    IAssetLedger& asset;
    IValueLedger& value;
    const IPriceFeed& feed;
    ILiquiditySink& sink;
    EventLog& events;
};

// =============================================================================
// CurveEngine - Linear bonding-curve issuance against an oracle price
// =============================================================================

class CurveEngine : public ITransactional {
public:
    // `self` is the account holding the unsold inventory and the settlement
    // reserve. Throws std::invalid_argument on an invalid config. The engine
    // enlists itself in `ctx`; no transaction may be open at that point.
    CurveEngine(const Address& self, const CurveConfig& config,
                CurveCollaborators collaborators, ExecutionContext& ctx,
                Clock clock = system_seconds);
    ~CurveEngine() override;

    // Non-copyable
    CurveEngine(const CurveEngine&) = delete;
    CurveEngine& operator=(const CurveEngine&) = delete;

    // =========================================================================
    // Trading
    // =========================================================================

    // Exchange `settlement_in` from `payer` for units delivered to
    // `beneficiary`. Fails with SLIPPAGE_EXCEEDED below `min_units_out`.
    BuyResult buy(const Address& payer, I128 settlement_in,
                  const Address& beneficiary, I128 min_units_out = 0);

    BuyResult buy(const Address& payer, I128 settlement_in) {
        return buy(payer, settlement_in, payer);
    }

    // Return `units_in` to the curve for settlement at the current price.
    // The seller must have approved the engine for `units_in`.
    SellResult sell(const Address& seller, I128 units_in);

    // Refresh the oracle cache if the update interval has elapsed. A fresh
    // cache is returned as is with `refreshed == false` and no event.
    OracleReading refresh_price();

    // =========================================================================
    // Views (never write state)
    // =========================================================================

    // Units `settlement_in` buys at the current price, bounded by what the
    // curve still holds. The quote does not model deployment: a buy that
    // takes `sold` past the sale threshold can still fail with
    // INSUFFICIENT_RESERVE_FOR_DEPLOYMENT when the overshoot eats into the
    // deployment slice.
    QuoteResult quote_buy(I128 settlement_in) const;
    QuoteResult quote_sell(I128 units_in) const;

    QuoteResult oracle_price() const;     // X18 reference price
    QuoteResult current_price() const;    // Curve price (1 / price_precision)
    QuoteResult initial_price() const;
    QuoteResult final_price() const;
    QuoteResult market_cap_usd() const;   // current_price * total_supply, X18

    I128 unsold_inventory() const { return state_.unsold_inventory; }
    I128 available_inventory() const;   // Units the curve can still deliver
    I128 sold_units() const { return config_.total_supply - state_.unsold_inventory; }
    I128 raised_usd() const { return state_.raised_usd_x18; }
    bool target_reached() const { return state_.raised_usd_x18 >= config_.raise_target_usd_x18; }
    bool liquidity_deployed() const { return state_.liquidity_deployed; }

    const CurveState& state() const { return state_; }
    const PriceCache& price_cache() const { return oracle_.cache(); }
    const CurveConfig& config() const { return config_; }
    const Address& address() const { return self_; }

    // =========================================================================
    // Administration
    // =========================================================================

    // First call returns the capability, later calls nullopt
    std::optional<AdminCapability> take_admin_capability();

    int32_t set_fee_collector(const AdminCapability& cap, const Address& collector);
    int32_t set_liquidity_collector(const AdminCapability& cap, const Address& collector);
    int32_t set_fee_percent(const AdminCapability& cap, uint32_t fee_percent);
    int32_t set_update_interval(const AdminCapability& cap, uint64_t interval);

    const Address& fee_collector() const { return settings_.fee_collector; }
    const Address& liquidity_collector() const { return settings_.liquidity_collector; }
    uint32_t fee_percent() const { return settings_.fee_percent; }
    uint64_t update_interval() const { return settings_.update_interval; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_buys;
        uint64_t total_sells;
        I128 units_bought;
        I128 units_sold;
        I128 settlement_in;
        I128 settlement_out;
        I128 fees_collected;
    };
    const Stats& stats() const { return stats_; }

    // ITransactional
    void checkpoint() override;
    void commit() override;
    void rollback() override;

private:
    // Admin-adjustable settings, journaled with the rest of the state
    struct Settings {
        Address fee_collector;
        Address liquidity_collector;
        uint32_t fee_percent;
        uint64_t update_interval;
    };

    struct Snapshot {
        CurveState state;
        PriceCache cache;
        Settings settings;
        Stats stats;
    };

    Address self_;
    const CurveConfig config_;
    IAssetLedger& asset_;
    IValueLedger& value_;
    ILiquiditySink& sink_;
    EventLog& events_;
    ExecutionContext& ctx_;
    Clock clock_;

    OracleCache oracle_;
    CurveState state_;
    Settings settings_;
    Stats stats_{};
    SnapshotJournal<Snapshot> journal_;

    uint64_t engine_id_;
    bool admin_taken_{false};
    bool busy_{false};

    // Operation bodies, run inside an open transaction
    int32_t execute_buy(const Address& payer, I128 settlement_in,
                        const Address& beneficiary, I128 min_units_out, BuyResult& result);
    int32_t execute_sell(const Address& seller, I128 units_in, SellResult& result);
    int32_t deploy_liquidity(uint64_t now, BuyResult& result);

    // Refresh when stale; emits PRICE_REFRESHED when the cache was written
    OracleReading sync_oracle(uint64_t now);

    // Pricing against an explicit oracle price and inventory level
    std::optional<I128> initial_price_at(I128 oracle_x18) const;
    std::optional<I128> final_price_at(I128 oracle_x18) const;
    std::optional<I128> price_at(I128 oracle_x18, I128 unsold) const;
    QuoteResult quote_buy_at(I128 oracle_x18, I128 price, I128 settlement_in) const;
    QuoteResult quote_sell_at(I128 oracle_x18, I128 price, I128 units_in) const;

    bool deployment_ready() const;
    bool authorized(const AdminCapability& cap) const { return cap.engine_id_ == engine_id_; }

    void emit(EventKind kind, uint64_t now, const Address& account,
              I128 units, I128 settlement, I128 price);
};

} // namespace bonding

#endif // BONDING_CURVE_HPP
