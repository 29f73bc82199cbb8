// =============================================================================
// ledger.cpp - In-memory asset and settlement ledgers
// =============================================================================

#include "bonding/ledger.hpp"

namespace bonding {

// =============================================================================
// TokenLedger
// =============================================================================

TokenLedger::TokenLedger(const Address& contract, std::string name, std::string symbol,
                         const Address& minter, uint8_t decimals)
    : contract_(contract)
    , name_(std::move(name))
    , symbol_(std::move(symbol))
    , minter_(minter)
    , decimals_(decimals) {}

I128 TokenLedger::balance_of(const Address& account) const {
    auto it = state_.balances.find(account);
    return it == state_.balances.end() ? 0 : it->second;
}

I128 TokenLedger::allowance(const Address& owner, const Address& spender) const {
    auto it = state_.allowances.find({owner, spender});
    return it == state_.allowances.end() ? 0 : it->second;
}

bool TokenLedger::move(const Address& from, const Address& to, I128 amount) {
    if (amount < 0 || addresses::is_zero(to)) return false;

    auto it = state_.balances.find(from);
    I128 available = it == state_.balances.end() ? 0 : it->second;
    if (available < amount) return false;
    if (amount == 0) return true;

    it->second -= amount;
    state_.balances[to] += amount;
    return true;
}

bool TokenLedger::transfer(const Address& from, const Address& to, I128 amount) {
    return move(from, to, amount);
}

bool TokenLedger::transfer_from(const Address& spender, const Address& from,
                                const Address& to, I128 amount) {
    if (amount < 0) return false;

    auto key = std::make_pair(from, spender);
    auto it = state_.allowances.find(key);
    I128 allowed = it == state_.allowances.end() ? 0 : it->second;
    if (allowed < amount) return false;

    if (!move(from, to, amount)) return false;
    if (amount > 0) it->second -= amount;
    return true;
}

bool TokenLedger::approve(const Address& owner, const Address& spender, I128 amount) {
    if (amount < 0 || addresses::is_zero(spender)) return false;
    state_.allowances[{owner, spender}] = amount;
    return true;
}

bool TokenLedger::mint(const Address& caller, const Address& to, I128 amount) {
    if (caller != minter_ || amount <= 0 || addresses::is_zero(to)) return false;
    state_.balances[to] += amount;
    state_.total_supply += amount;
    return true;
}

bool TokenLedger::burn(const Address& caller, const Address& from, I128 amount) {
    if (caller != minter_ || amount <= 0) return false;

    auto it = state_.balances.find(from);
    if (it == state_.balances.end() || it->second < amount) return false;
    it->second -= amount;
    state_.total_supply -= amount;
    return true;
}

// =============================================================================
// ValueLedger
// =============================================================================

I128 ValueLedger::balance_of(const Address& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

bool ValueLedger::transfer(const Address& from, const Address& to, I128 amount) {
    if (amount < 0 || addresses::is_zero(to)) return false;
    if (balance_of(from) < amount) return false;

    balances_[from] -= amount;
    balances_[to] += amount;

    auto hook = hooks_.find(to);
    if (hook != hooks_.end() && hook->second) {
        // Copy: the hook may replace itself while running
        ReceiveHook fn = hook->second;
        if (!fn(from, amount)) {
            balances_[to] -= amount;
            balances_[from] += amount;
            return false;
        }
    }
    return true;
}

void ValueLedger::credit(const Address& account, I128 amount) {
    if (amount <= 0) return;
    balances_[account] += amount;
}

void ValueLedger::set_receive_hook(const Address& account, ReceiveHook hook) {
    hooks_[account] = std::move(hook);
}

void ValueLedger::clear_receive_hook(const Address& account) {
    hooks_.erase(account);
}

I128 ValueLedger::total_value() const {
    I128 total = 0;
    for (const auto& [account, balance] : balances_) total += balance;
    return total;
}

} // namespace bonding
