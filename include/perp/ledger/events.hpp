// Perp Ledger - Events
// Audit records emitted by committed transitions

#ifndef PERP_LEDGER_EVENTS_HPP
#define PERP_LEDGER_EVENTS_HPP

#include <perp/ledger/types.hpp>
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <variant>
#include <vector>

namespace perp::ledger {

// =============================================================================
// Event Payloads
// =============================================================================

struct OrderCreated {
    Order order;
};

struct OrderCancelled {
    OrderId order_id;
    Address owner;
    Address cancelled_by;
    I128 refund;
};

struct PositionOpened {
    Position position;
    OrderId order_id;
    I128 commission_accrued;
};

struct TriggerSet {
    TriggerId trigger_id;
    PositionId position_id;
    TriggerKind kind;
    I128 price;
};

// old_id / new_id are NO_ID when absent
struct TriggerChanged {
    PositionId position_id;
    TriggerKind kind;
    TriggerId old_id;
    TriggerId new_id;
};

struct TriggerRemoved {
    TriggerId trigger_id;
    PositionId position_id;
    TriggerKind kind;
};

struct PositionClosed {
    PositionId position_id;
    Address owner;
    I128 pnl;
    I128 closing_commission;
    I128 payout;
    I128 pool_delta;        // signed, from the pool's point of view
    I128 uncollected_loss;  // loss beyond net margin, never collected
};

struct PoolFunded {
    Address from;
    I128 amount;
    I128 pool_balance;
};

struct PoolWithdrawn {
    Address to;
    I128 amount;
    I128 pool_balance;
};

struct CommissionWithdrawn {
    Address account;
    I128 amount;
};

using EventPayload = std::variant<
    OrderCreated,
    OrderCancelled,
    PositionOpened,
    TriggerSet,
    TriggerChanged,
    TriggerRemoved,
    PositionClosed,
    PoolFunded,
    PoolWithdrawn,
    CommissionWithdrawn>;

struct LedgerEvent {
    uint64_t sequence;
    EventPayload payload;
};

const char* event_name(const EventPayload& payload);

nlohmann::json to_json(const LedgerEvent& event);

// =============================================================================
// Event Buffer (filled during a transaction, drained on commit)
// =============================================================================

class EventQueue {
public:
    void push(EventPayload payload) { pending_.push_back(std::move(payload)); }

    [[nodiscard]] std::vector<EventPayload> drain() {
        std::vector<EventPayload> out;
        out.swap(pending_);
        return out;
    }

    void clear() noexcept { pending_.clear(); }
    [[nodiscard]] bool empty() const noexcept { return pending_.empty(); }

private:
    std::vector<EventPayload> pending_;
};

// =============================================================================
// Listeners
// =============================================================================

// Called after the emitting transaction committed and released the ledger lock
class EventListener {
public:
    virtual ~EventListener() = default;
    virtual void on_event(const LedgerEvent& event) = 0;
};

// Keeps every event in memory
class EventLog : public EventListener {
public:
    void on_event(const LedgerEvent& event) override;

    [[nodiscard]] std::vector<LedgerEvent> events() const;
    [[nodiscard]] size_t size() const;
    void clear();

    template <typename T>
    [[nodiscard]] std::vector<T> of_type() const {
        std::lock_guard lock(mutex_);
        std::vector<T> out;
        for (const auto& event : events_) {
            if (const auto* payload = std::get_if<T>(&event.payload)) {
                out.push_back(*payload);
            }
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::vector<LedgerEvent> events_;
};

// One JSON object per line
class JsonLinesWriter : public EventListener {
public:
    explicit JsonLinesWriter(std::ostream& out) : out_(out) {}

    void on_event(const LedgerEvent& event) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace perp::ledger

#endif // PERP_LEDGER_EVENTS_HPP
