// =============================================================================
// admin.cpp - Capability-gated settings updates
// =============================================================================

#include "bonding/curve.hpp"

namespace bonding {

std::optional<AdminCapability> CurveEngine::take_admin_capability() {
    if (admin_taken_) return std::nullopt;
    admin_taken_ = true;
    return AdminCapability{engine_id_};
}

int32_t CurveEngine::set_fee_collector(const AdminCapability& cap, const Address& collector) {
    if (!authorized(cap)) return errors::UNAUTHORIZED;
    if (busy_) return errors::REENTRANCY;
    if (addresses::is_zero(collector)) return errors::INVALID_CONFIG;

    Transaction tx = ctx_.begin();
    settings_.fee_collector = collector;
    tx.commit();
    return errors::OK;
}

int32_t CurveEngine::set_liquidity_collector(const AdminCapability& cap, const Address& collector) {
    if (!authorized(cap)) return errors::UNAUTHORIZED;
    if (busy_) return errors::REENTRANCY;
    if (addresses::is_zero(collector)) return errors::INVALID_CONFIG;

    Transaction tx = ctx_.begin();
    settings_.liquidity_collector = collector;
    tx.commit();
    return errors::OK;
}

int32_t CurveEngine::set_fee_percent(const AdminCapability& cap, uint32_t fee_percent) {
    if (!authorized(cap)) return errors::UNAUTHORIZED;
    if (busy_) return errors::REENTRANCY;
    if (fee_percent > MAX_FEE_PERCENT) return errors::INVALID_CONFIG;

    Transaction tx = ctx_.begin();
    settings_.fee_percent = fee_percent;
    tx.commit();
    return errors::OK;
}

int32_t CurveEngine::set_update_interval(const AdminCapability& cap, uint64_t interval) {
    if (!authorized(cap)) return errors::UNAUTHORIZED;
    if (busy_) return errors::REENTRANCY;

    Transaction tx = ctx_.begin();
    settings_.update_interval = interval;
    oracle_.set_update_interval(interval);
    tx.commit();
    return errors::OK;
}

} // namespace bonding
