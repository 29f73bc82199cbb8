// =============================================================================
// events.cpp - Journaled audit log
// =============================================================================

#include "bonding/events.hpp"

namespace bonding {

const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::PURCHASE_EXECUTED: return "PurchaseExecuted";
        case EventKind::SALE_EXECUTED: return "SaleExecuted";
        case EventKind::PRICE_REFRESHED: return "PriceRefreshed";
        case EventKind::LIQUIDITY_DEPLOYED: return "LiquidityDeployed";
        case EventKind::LIQUIDITY_ADDED: return "LiquidityAdded";
    }
    return "Unknown";
}

uint64_t EventLog::emit(EventRecord record) {
    record.seq = next_seq_++;
    records_.push_back(record);
    if (marks_.empty()) deliver();
    return record.seq;
}

std::vector<EventRecord> EventLog::filter(EventKind kind) const {
    std::vector<EventRecord> out;
    for (const auto& r : records_) {
        if (r.kind == kind) out.push_back(r);
    }
    return out;
}

void EventLog::checkpoint() {
    marks_.push_back({records_.size(), next_seq_});
}

void EventLog::commit() {
    if (marks_.empty()) return;
    marks_.pop_back();
    if (marks_.empty()) deliver();
}

void EventLog::rollback() {
    if (marks_.empty()) return;
    Mark mark = marks_.back();
    marks_.pop_back();
    records_.resize(mark.size);
    next_seq_ = mark.next_seq;
    if (delivered_ > records_.size()) delivered_ = records_.size();
}

void EventLog::deliver() {
    while (delivered_ < records_.size()) {
        EventRecord record = records_[delivered_++];
        if (listener_) listener_->on_event(record);
    }
}

} // namespace bonding
