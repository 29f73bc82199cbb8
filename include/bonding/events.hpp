#ifndef BONDING_EVENTS_HPP
#define BONDING_EVENTS_HPP

#include <cstdint>
#include <vector>
#include <string>

#include "types.hpp"
#include "journal.hpp"

namespace bonding {

// =============================================================================
// Audit Event Types
// =============================================================================

enum class EventKind : uint8_t {
    PURCHASE_EXECUTED = 0,   // account = buyer, units, settlement = settlement in
    SALE_EXECUTED = 1,       // account = seller, units, settlement = settlement out
    PRICE_REFRESHED = 2,     // price = new oracle price (X18)
    LIQUIDITY_DEPLOYED = 3,  // settlement = venue deposit, units = inventory slice
    LIQUIDITY_ADDED = 4      // emitted by the venue adapter; account = collector
};

const char* event_kind_name(EventKind kind);

struct EventRecord {
    uint64_t seq;            // Monotonic across the committed log
    uint64_t timestamp;
    EventKind kind;
    Address emitter;         // Contract that produced the record
    Address account;
    I128 units;
    I128 settlement;
    I128 price;
};

// =============================================================================
// Event Listener (notified only for committed records)
// =============================================================================

class EventListener {
public:
    virtual ~EventListener() = default;
    virtual void on_event(const EventRecord& record) = 0;
};

class NullEventListener : public EventListener {
public:
    void on_event(const EventRecord&) override {}
};

// =============================================================================
// EventLog - Append-only, journaled audit log
// =============================================================================

class EventLog : public ITransactional {
public:
    EventLog() = default;

    // Non-copyable
    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    // Append a record; seq is assigned here. Returns the sequence number.
    uint64_t emit(EventRecord record);

    const std::vector<EventRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    uint64_t next_seq() const { return next_seq_; }

    // Records of one kind, in order
    std::vector<EventRecord> filter(EventKind kind) const;

    void set_listener(EventListener* listener) { listener_ = listener; }

    // ITransactional
    void checkpoint() override;
    void commit() override;
    void rollback() override;

private:
    struct Mark {
        size_t size;
        uint64_t next_seq;
    };

    std::vector<EventRecord> records_;
    std::vector<Mark> marks_;
    uint64_t next_seq_{1};
    size_t delivered_{0};
    EventListener* listener_{nullptr};

    void deliver();
};

} // namespace bonding

#endif // BONDING_EVENTS_HPP
