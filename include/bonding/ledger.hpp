#ifndef BONDING_LEDGER_HPP
#define BONDING_LEDGER_HPP

#include <map>
#include <unordered_map>
#include <string>
#include <functional>
#include <utility>

#include "types.hpp"
#include "journal.hpp"

namespace bonding {

// =============================================================================
// Asset Ledger Interface (ERC20-style issued asset)
// =============================================================================

class IAssetLedger {
public:
    virtual ~IAssetLedger() = default;

    // Address of the asset contract itself
    virtual Address address() const = 0;

    virtual I128 balance_of(const Address& account) const = 0;
    virtual I128 allowance(const Address& owner, const Address& spender) const = 0;

    // Mutations return false on rejection and leave balances untouched
    virtual bool transfer(const Address& from, const Address& to, I128 amount) = 0;
    virtual bool transfer_from(const Address& spender, const Address& from,
                               const Address& to, I128 amount) = 0;
    virtual bool approve(const Address& owner, const Address& spender, I128 amount) = 0;
};

// =============================================================================
// Settlement Ledger Interface (native value balances)
// =============================================================================

class IValueLedger {
public:
    virtual ~IValueLedger() = default;

    virtual I128 balance_of(const Address& account) const = 0;
    virtual bool transfer(const Address& from, const Address& to, I128 amount) = 0;
};

// =============================================================================
// TokenLedger - In-memory issued-asset ledger
// =============================================================================

class TokenLedger : public IAssetLedger, public ITransactional {
public:
    TokenLedger(const Address& contract, std::string name, std::string symbol,
                const Address& minter, uint8_t decimals = 18);

    // Non-copyable
    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    // IAssetLedger
    Address address() const override { return contract_; }
    I128 balance_of(const Address& account) const override;
    I128 allowance(const Address& owner, const Address& spender) const override;
    bool transfer(const Address& from, const Address& to, I128 amount) override;
    bool transfer_from(const Address& spender, const Address& from,
                       const Address& to, I128 amount) override;
    bool approve(const Address& owner, const Address& spender, I128 amount) override;

    // Supply management, restricted to the minter identity
    bool mint(const Address& caller, const Address& to, I128 amount);
    bool burn(const Address& caller, const Address& from, I128 amount);

    const std::string& name() const { return name_; }
    const std::string& symbol() const { return symbol_; }
    uint8_t decimals() const { return decimals_; }
    I128 total_supply() const { return state_.total_supply; }
    const Address& minter() const { return minter_; }

    // ITransactional
    void checkpoint() override { journal_.push(state_); }
    void commit() override { journal_.pop(); }
    void rollback() override { journal_.restore(state_); }

private:
    struct State {
        std::unordered_map<Address, I128, addresses::Hash> balances;
        std::map<std::pair<Address, Address>, I128> allowances;
        I128 total_supply{0};
    };

    Address contract_;
    std::string name_;
    std::string symbol_;
    Address minter_;
    uint8_t decimals_;

    State state_;
    SnapshotJournal<State> journal_;

    bool move(const Address& from, const Address& to, I128 amount);
};

// =============================================================================
// ValueLedger - In-memory native settlement balances
// =============================================================================

class ValueLedger : public IValueLedger, public ITransactional {
public:
    // Invoked after value lands in a hooked account; returning false rejects
    // the transfer (the account "reverts"). Hooks may call back into other
    // contracts.
    using ReceiveHook = std::function<bool(const Address& from, I128 amount)>;

    ValueLedger() = default;

    // Non-copyable
    ValueLedger(const ValueLedger&) = delete;
    ValueLedger& operator=(const ValueLedger&) = delete;

    // IValueLedger
    I128 balance_of(const Address& account) const override;
    bool transfer(const Address& from, const Address& to, I128 amount) override;

    // Genesis/faucet credit (outside of any transfer)
    void credit(const Address& account, I128 amount);

    void set_receive_hook(const Address& account, ReceiveHook hook);
    void clear_receive_hook(const Address& account);

    I128 total_value() const;

    // ITransactional
    void checkpoint() override { journal_.push(balances_); }
    void commit() override { journal_.pop(); }
    void rollback() override { journal_.restore(balances_); }

private:
    using Balances = std::unordered_map<Address, I128, addresses::Hash>;

    Balances balances_;
    SnapshotJournal<Balances> journal_;
    std::unordered_map<Address, ReceiveHook, addresses::Hash> hooks_;
};

} // namespace bonding

#endif // BONDING_LEDGER_HPP
