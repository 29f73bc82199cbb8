// =============================================================================
// sink.cpp - Liquidity venue adapter
// =============================================================================

#include "bonding/sink.hpp"

namespace bonding {

PoolLiquiditySink::PoolLiquiditySink(const Address& self, const Address& venue,
                                     IAssetLedger& asset_ledger, IValueLedger& value_ledger,
                                     EventLog& events)
    : self_(self)
    , venue_(venue)
    , asset_ledger_(asset_ledger)
    , value_ledger_(value_ledger)
    , events_(events)
    , clock_(system_seconds) {}

SinkResult PoolLiquiditySink::deploy(const Address& caller, const Address& asset,
                                     I128 units_amount, const Address& collector,
                                     I128 settlement) {
    if (!addresses::is_zero(authorized_caller_) && caller != authorized_caller_) {
        return SinkResult::failure("unauthorized caller");
    }
    if (asset != asset_ledger_.address()) {
        return SinkResult::failure("unsupported asset");
    }
    if (units_amount <= 0 || settlement <= 0) {
        return SinkResult::failure("empty deposit");
    }
    if (deposits_.count(asset) != 0) {
        return SinkResult::failure("pool already seeded");
    }
    if (value_ledger_.balance_of(self_) < settlement) {
        return SinkResult::failure("settlement not attached");
    }

    // Pull inventory from the caller, forward both sides to the pool
    if (!asset_ledger_.transfer_from(self_, caller, venue_, units_amount)) {
        return SinkResult::failure("asset transfer rejected");
    }
    if (!value_ledger_.transfer(self_, venue_, settlement)) {
        return SinkResult::failure("settlement transfer rejected");
    }

    uint64_t now = clock_();
    deposits_[asset] = PoolDeposit{asset, collector, units_amount, settlement, now};

    EventRecord record{};
    record.timestamp = now;
    record.kind = EventKind::LIQUIDITY_ADDED;
    record.emitter = self_;
    record.account = collector;
    record.units = units_amount;
    record.settlement = settlement;
    events_.emit(record);

    return SinkResult::success();
}

std::optional<PoolDeposit> PoolLiquiditySink::deposit(const Address& asset) const {
    auto it = deposits_.find(asset);
    if (it == deposits_.end()) return std::nullopt;
    return it->second;
}

} // namespace bonding
