// Perp Ledger - Ledger
// Thread-safe facade: one serializable transaction per public call

#ifndef PERP_LEDGER_LEDGER_HPP
#define PERP_LEDGER_LEDGER_HPP

#include <perp/ledger/asset_ledger.hpp>
#include <perp/ledger/config.hpp>
#include <perp/ledger/events.hpp>
#include <perp/ledger/gateway.hpp>
#include <perp/ledger/log.hpp>
#include <perp/ledger/order_book.hpp>
#include <perp/ledger/position_book.hpp>
#include <perp/ledger/settlement.hpp>
#include <perp/ledger/trader_index.hpp>
#include <perp/ledger/trigger_registry.hpp>
#include <perp/ledger/types.hpp>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <fstream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <vector>

namespace perp::ledger {

// Conservation: custodied == order_locked + position_margin + accrued + pool
struct AuditSnapshot {
    I128 custodied = 0;
    I128 order_locked = 0;
    I128 position_margin = 0;
    I128 accrued = 0;
    I128 pool = 0;

    [[nodiscard]] bool balanced() const noexcept {
        return custodied == order_locked + position_margin + accrued + pool;
    }
};

struct LedgerStats {
    size_t live_orders = 0;
    size_t live_positions = 0;
    size_t live_triggers = 0;
    uint64_t orders_created = 0;
    uint64_t positions_opened = 0;
    uint64_t positions_closed = 0;
    uint64_t events_emitted = 0;
    I128 commission_accrued = 0;
};

class Ledger {
public:
    // Seconds since epoch; stamps Order::created_at
    using Clock = std::function<uint64_t()>;

    // Validates the config (ConfigError) and applies its log level.
    // gateway and access must outlive the ledger.
    Ledger(LedgerConfig config, TransferGateway& gateway, const AccessPolicy& access,
           Clock clock = Clock());
    ~Ledger();

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    // =========================================================================
    // Orders
    // =========================================================================

    OrderId create_order(const OrderRequest& request);
    I128 cancel_order(OrderId id, const Address& caller);

    // =========================================================================
    // Positions
    // =========================================================================

    PositionId execute_order(OrderId id, I128 open_price, uint64_t opened_at, const Address& caller);
    void set_stop_loss(PositionId id, I128 price, const Address& caller);
    void set_take_profit(PositionId id, I128 price, const Address& caller);
    CloseResult close_position(PositionId id, I128 pnl, I128 closing_commission, const Address& caller);

    // =========================================================================
    // Balances
    // =========================================================================

    void fund_pool(const Address& from, I128 amount);
    void withdraw_pool(const Address& to, I128 amount, const Address& caller);
    I128 withdraw_commission(const Address& caller);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] Order order(OrderId id) const;
    [[nodiscard]] Position position(PositionId id) const;
    [[nodiscard]] Trigger trigger(TriggerId id) const;
    [[nodiscard]] std::vector<Trigger> triggers_of(PositionId id) const;
    [[nodiscard]] std::vector<OrderId> orders_of(const Address& account) const;
    [[nodiscard]] std::vector<PositionId> positions_of(const Address& account) const;
    [[nodiscard]] I128 accrued_commission(const Address& account) const;
    [[nodiscard]] I128 pool_balance() const;

    [[nodiscard]] AuditSnapshot audit() const;
    [[nodiscard]] LedgerStats stats() const;

    [[nodiscard]] const LedgerConfig& config() const noexcept { return config_; }

    // Listener must outlive the ledger. Events reach listeners in sequence
    // order, after the emitting call released the lock. Listeners may query
    // the ledger but not mutate it (Reentrancy). A std::exception from a
    // listener is logged; anything else propagates to the caller.
    void add_listener(EventListener* listener);

private:
    class WriteScope;
    class ReadScope;
    class PublishTurn;

    template <typename Fn>
    auto transact(const char* operation, Fn&& fn);

    void reject_reentry(const char* operation, bool writing) const;
    void publish(uint64_t batch, const std::vector<LedgerEvent>& events);

    LedgerConfig config_;
    Clock clock_;

    AssetLedger custody_;
    TriggerRegistry triggers_;
    TraderIndex index_;
    EventQueue pending_;
    OrderBook orders_;
    PositionBook positions_;
    SettlementEngine settlement_;

    mutable std::shared_mutex mutex_;
    std::atomic<std::thread::id> writer_{std::thread::id()};
    uint64_t next_sequence_ = 1;
    uint64_t next_batch_ = 0;

    // Committed batches are published strictly in batch order
    std::mutex publish_mutex_;
    std::condition_variable publish_cv_;
    uint64_t published_batches_ = 0;
    std::atomic<std::thread::id> publisher_{std::thread::id()};
    std::vector<EventListener*> listeners_;

    std::unique_ptr<std::ofstream> audit_file_;
    std::unique_ptr<JsonLinesWriter> audit_writer_;

    std::shared_ptr<spdlog::logger> logger_ = component_logger("ledger");
};

} // namespace perp::ledger

#endif // PERP_LEDGER_LEDGER_HPP
