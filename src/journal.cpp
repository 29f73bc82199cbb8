// =============================================================================
// journal.cpp - Checkpoint/rollback substrate for atomic operations
// =============================================================================

#include "bonding/journal.hpp"

#include <algorithm>
#include <stdexcept>

namespace bonding {

// =============================================================================
// ExecutionContext
// =============================================================================

void ExecutionContext::enlist(ITransactional* participant) {
    if (participant == nullptr) return;
    if (depth_ != 0) {
        throw std::logic_error("ExecutionContext: enlist inside open transaction");
    }
    if (std::find(participants_.begin(), participants_.end(), participant) ==
        participants_.end()) {
        participants_.push_back(participant);
    }
}

void ExecutionContext::delist(ITransactional* participant) {
    participants_.erase(
        std::remove(participants_.begin(), participants_.end(), participant),
        participants_.end());
}

Transaction ExecutionContext::begin() {
    checkpoint_all();
    return Transaction(this);
}

void ExecutionContext::checkpoint_all() {
    for (ITransactional* p : participants_) p->checkpoint();
    ++depth_;
}

void ExecutionContext::commit_all() {
    // Innermost first (reverse enlist order)
    for (auto it = participants_.rbegin(); it != participants_.rend(); ++it) {
        (*it)->commit();
    }
    --depth_;
}

void ExecutionContext::rollback_all() {
    for (auto it = participants_.rbegin(); it != participants_.rend(); ++it) {
        (*it)->rollback();
    }
    --depth_;
}

// =============================================================================
// Transaction
// =============================================================================

Transaction::Transaction(ExecutionContext* ctx) : ctx_(ctx) {}

Transaction::Transaction(Transaction&& other) noexcept : ctx_(other.ctx_) {
    other.ctx_ = nullptr;
}

Transaction::~Transaction() {
    if (ctx_) ctx_->rollback_all();
}

void Transaction::commit() {
    if (!ctx_) return;
    ctx_->commit_all();
    ctx_ = nullptr;
}

void Transaction::rollback() {
    if (!ctx_) return;
    ctx_->rollback_all();
    ctx_ = nullptr;
}

} // namespace bonding
