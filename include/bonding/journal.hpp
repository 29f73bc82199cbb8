#ifndef BONDING_JOURNAL_HPP
#define BONDING_JOURNAL_HPP

#include <vector>
#include <cstddef>
#include <utility>

namespace bonding {

// =============================================================================
// Transactional Participant
// =============================================================================

// Anything whose state must roll back with a failed operation. Checkpoints
// nest: every checkpoint() is matched by exactly one commit() or rollback(),
// innermost first.
class ITransactional {
public:
    virtual ~ITransactional() = default;

    virtual void checkpoint() = 0;
    virtual void commit() = 0;    // Drop the latest checkpoint, keep changes
    virtual void rollback() = 0;  // Restore the latest checkpoint
};

// =============================================================================
// Snapshot Journal (copy-on-checkpoint helper for simple state)
// =============================================================================

template <typename State>
class SnapshotJournal {
public:
    void push(const State& state) { snapshots_.push_back(state); }

    void pop() {
        if (!snapshots_.empty()) snapshots_.pop_back();
    }

    void restore(State& state) {
        if (snapshots_.empty()) return;
        state = std::move(snapshots_.back());
        snapshots_.pop_back();
    }

    size_t depth() const { return snapshots_.size(); }

private:
    std::vector<State> snapshots_;
};

class Transaction;

// =============================================================================
// ExecutionContext - All-or-nothing execution substrate
// =============================================================================

class ExecutionContext {
public:
    ExecutionContext() = default;
    ~ExecutionContext() = default;

    // Non-copyable
    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    // Register / remove a participant. Must not be called while a
    // transaction is open.
    void enlist(ITransactional* participant);
    void delist(ITransactional* participant);

    // Open a (possibly nested) transaction over every participant
    Transaction begin();

    size_t depth() const { return depth_; }
    size_t participants() const { return participants_.size(); }

private:
    friend class Transaction;

    std::vector<ITransactional*> participants_;
    size_t depth_{0};

    void checkpoint_all();
    void commit_all();
    void rollback_all();
};

// =============================================================================
// Transaction - RAII scope, rolls back unless committed
// =============================================================================

class Transaction {
public:
    ~Transaction();

    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&&) = delete;
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();
    void rollback();
    bool active() const { return ctx_ != nullptr; }

private:
    friend class ExecutionContext;
    explicit Transaction(ExecutionContext* ctx);

    ExecutionContext* ctx_;
};

} // namespace bonding

#endif // BONDING_JOURNAL_HPP
