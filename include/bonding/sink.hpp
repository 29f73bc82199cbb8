#ifndef BONDING_SINK_HPP
#define BONDING_SINK_HPP

#include <string>
#include <unordered_map>
#include <optional>

#include "types.hpp"
#include "journal.hpp"
#include "ledger.hpp"
#include "events.hpp"

namespace bonding {

// =============================================================================
// Sink Result (Ok / Err{reason})
// =============================================================================

struct SinkResult {
    bool ok;
    std::string reason;

    static SinkResult success() { return {true, {}}; }
    static SinkResult failure(std::string why) { return {false, std::move(why)}; }
};

// =============================================================================
// Liquidity Sink Interface
// =============================================================================

class ILiquiditySink {
public:
    virtual ~ILiquiditySink() = default;

    // Account that receives the attached settlement and the asset allowance
    virtual Address address() const = 0;

    // One-time deposit of units_amount of `asset` (pulled from `caller` via
    // allowance) plus `settlement` already sent to address().
    virtual SinkResult deploy(const Address& caller, const Address& asset,
                              I128 units_amount, const Address& collector,
                              I128 settlement) = 0;
};

// =============================================================================
// PoolLiquiditySink - Venue adapter seeding a two-asset pool
// =============================================================================

struct PoolDeposit {
    Address asset;
    Address collector;    // Receives the pool position
    I128 units;
    I128 settlement;
    uint64_t timestamp;
};

class PoolLiquiditySink : public ILiquiditySink, public ITransactional {
public:
    // `venue` is the pool account that ends up holding both sides.
    PoolLiquiditySink(const Address& self, const Address& venue,
                      IAssetLedger& asset_ledger, IValueLedger& value_ledger,
                      EventLog& events);

    // Non-copyable
    PoolLiquiditySink(const PoolLiquiditySink&) = delete;
    PoolLiquiditySink& operator=(const PoolLiquiditySink&) = delete;

    Address address() const override { return self_; }
    SinkResult deploy(const Address& caller, const Address& asset,
                      I128 units_amount, const Address& collector,
                      I128 settlement) override;

    // Only this caller may deploy (zero = anyone)
    void set_authorized_caller(const Address& caller) { authorized_caller_ = caller; }
    const Address& authorized_caller() const { return authorized_caller_; }

    const Address& venue() const { return venue_; }
    std::optional<PoolDeposit> deposit(const Address& asset) const;
    size_t deposit_count() const { return deposits_.size(); }

    void set_clock(Clock clock) { clock_ = std::move(clock); }

    // ITransactional
    void checkpoint() override { journal_.push(deposits_); }
    void commit() override { journal_.pop(); }
    void rollback() override { journal_.restore(deposits_); }

private:
    using Deposits = std::unordered_map<Address, PoolDeposit, addresses::Hash>;

    Address self_;
    Address venue_;
    Address authorized_caller_{};
    IAssetLedger& asset_ledger_;
    IValueLedger& value_ledger_;
    EventLog& events_;
    Clock clock_;

    Deposits deposits_;
    SnapshotJournal<Deposits> journal_;
};

} // namespace bonding

#endif // BONDING_SINK_HPP
