// Perp Ledger - Ledger Implementation

#include <perp/ledger/ledger.hpp>
#include <perp/ledger/errors.hpp>
#include <chrono>
#include <optional>
#include <type_traits>

namespace perp::ledger {

namespace {

uint64_t system_seconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

LedgerConfig validated(LedgerConfig config) {
    config.validate();
    return config;
}

}  // namespace

// =============================================================================
// Lock Scopes
// =============================================================================

// Exclusive lock for one mutating call. Records the writer thread so that a
// call back into the ledger from the gateway fails instead of deadlocking.
class Ledger::WriteScope {
public:
    WriteScope(Ledger& ledger, const char* operation) : ledger_(ledger) {
        ledger_.reject_reentry(operation, true);
        lock_ = std::unique_lock<std::shared_mutex>(ledger_.mutex_);
        ledger_.writer_.store(std::this_thread::get_id());
        ledger_.pending_.clear();
    }

    ~WriteScope() {
        ledger_.pending_.clear();
        ledger_.writer_.store(std::thread::id());
    }

    WriteScope(const WriteScope&) = delete;
    WriteScope& operator=(const WriteScope&) = delete;

    // Stamps queued events with sequence numbers. Returns the publication
    // batch, or nothing when the call emitted no events.
    std::optional<uint64_t> commit(std::vector<LedgerEvent>& out) {
        for (auto& payload : ledger_.pending_.drain()) {
            out.push_back(LedgerEvent{ledger_.next_sequence_++, std::move(payload)});
        }
        if (out.empty()) {
            return std::nullopt;
        }
        return ledger_.next_batch_++;
    }

private:
    Ledger& ledger_;
    std::unique_lock<std::shared_mutex> lock_;
};

class Ledger::ReadScope {
public:
    explicit ReadScope(const Ledger& ledger) {
        ledger.reject_reentry("query", false);
        lock_ = std::shared_lock<std::shared_mutex>(ledger.mutex_);
    }

private:
    std::shared_lock<std::shared_mutex> lock_;
};

// Holds this thread's turn to publish one batch. The turn passes to the next
// batch on every exit path, including a listener throwing something that is
// not a std::exception.
class Ledger::PublishTurn {
public:
    PublishTurn(Ledger& ledger, uint64_t batch) : ledger_(ledger) {
        std::unique_lock<std::mutex> lock(ledger_.publish_mutex_);
        ledger_.publish_cv_.wait(lock, [&] { return ledger_.published_batches_ == batch; });
        ledger_.publisher_.store(std::this_thread::get_id());
    }

    ~PublishTurn() {
        ledger_.publisher_.store(std::thread::id());
        {
            std::lock_guard<std::mutex> lock(ledger_.publish_mutex_);
            ++ledger_.published_batches_;
        }
        ledger_.publish_cv_.notify_all();
    }

    PublishTurn(const PublishTurn&) = delete;
    PublishTurn& operator=(const PublishTurn&) = delete;

    std::vector<EventListener*> listeners() const {
        std::lock_guard<std::mutex> lock(ledger_.publish_mutex_);
        return ledger_.listeners_;
    }

private:
    Ledger& ledger_;
};

// =============================================================================
// Constructor / Destructor
// =============================================================================

Ledger::Ledger(LedgerConfig config, TransferGateway& gateway, const AccessPolicy& access, Clock clock)
    : config_(validated(std::move(config))),
      clock_(clock ? std::move(clock) : Clock(system_seconds)),
      custody_(gateway),
      orders_(custody_, index_, access, pending_),
      positions_(triggers_, index_),
      settlement_(orders_, positions_, custody_, access, pending_, config_) {
    spdlog::set_level(parse_log_level(config_.general.log_level));

    if (!config_.general.audit_log.empty()) {
        audit_file_ = std::make_unique<std::ofstream>(config_.general.audit_log, std::ios::app);
        if (!audit_file_->is_open()) {
            throw ConfigError("cannot open audit log: " + config_.general.audit_log);
        }
        audit_writer_ = std::make_unique<JsonLinesWriter>(*audit_file_);
        listeners_.push_back(audit_writer_.get());
    }

    logger_->info("ready with {} executor(s), commission receiver {}", config_.roles.executors.size(),
                  address::to_hex(config_.roles.commission_receiver));
}

Ledger::~Ledger() = default;

// =============================================================================
// Transactions
// =============================================================================

template <typename Fn>
auto Ledger::transact(const char* operation, Fn&& fn) {
    using Result = std::invoke_result_t<Fn&>;

    std::vector<LedgerEvent> committed;
    std::optional<uint64_t> batch;

    auto run = [&]() -> Result {
        WriteScope scope(*this, operation);
        try {
            if constexpr (std::is_void_v<Result>) {
                fn();
                batch = scope.commit(committed);
            } else {
                Result result = fn();
                batch = scope.commit(committed);
                return result;
            }
        } catch (const LedgerError& e) {
            logger_->warn("{} rejected ({}): {}", operation, to_string(e.code()), e.what());
            throw;
        }
    };

    if constexpr (std::is_void_v<Result>) {
        run();
        if (batch) publish(*batch, committed);
    } else {
        Result result = run();
        if (batch) publish(*batch, committed);
        return result;
    }
}

void Ledger::reject_reentry(const char* operation, bool writing) const {
    const auto self = std::this_thread::get_id();
    if (writer_.load() == self || (writing && publisher_.load() == self)) {
        logger_->warn("{} re-entered the ledger", operation);
        throw LedgerError(ErrorCode::Reentrancy,
            std::string(operation) + " called while this thread is inside a ledger transaction");
    }
}

void Ledger::publish(uint64_t batch, const std::vector<LedgerEvent>& events) {
    PublishTurn turn(*this, batch);
    const std::vector<EventListener*> listeners = turn.listeners();

    for (const auto& event : events) {
        for (EventListener* listener : listeners) {
            try {
                listener->on_event(event);
            } catch (const std::exception& e) {
                logger_->error("listener failed on event {} ({}): {}", event.sequence,
                               event_name(event.payload), e.what());
            }
        }
    }
}

void Ledger::add_listener(EventListener* listener) {
    if (listener == nullptr) {
        throw LedgerError(ErrorCode::InvalidParameter, "listener must not be null");
    }
    std::lock_guard<std::mutex> lock(publish_mutex_);
    listeners_.push_back(listener);
}

// =============================================================================
// Orders
// =============================================================================

OrderId Ledger::create_order(const OrderRequest& request) {
    return transact("create_order", [&] {
        return orders_.create(request, clock_());
    });
}

I128 Ledger::cancel_order(OrderId id, const Address& caller) {
    return transact("cancel_order", [&] {
        return orders_.cancel(id, caller);
    });
}

// =============================================================================
// Positions
// =============================================================================

PositionId Ledger::execute_order(OrderId id, I128 open_price, uint64_t opened_at, const Address& caller) {
    return transact("execute_order", [&] {
        return settlement_.execute(id, open_price, opened_at, caller);
    });
}

void Ledger::set_stop_loss(PositionId id, I128 price, const Address& caller) {
    transact("set_stop_loss", [&] {
        settlement_.set_trigger(id, TriggerKind::StopLoss, price, caller);
    });
}

void Ledger::set_take_profit(PositionId id, I128 price, const Address& caller) {
    transact("set_take_profit", [&] {
        settlement_.set_trigger(id, TriggerKind::TakeProfit, price, caller);
    });
}

CloseResult Ledger::close_position(PositionId id, I128 pnl, I128 closing_commission, const Address& caller) {
    return transact("close_position", [&] {
        return settlement_.close(id, pnl, closing_commission, caller);
    });
}

// =============================================================================
// Balances
// =============================================================================

void Ledger::fund_pool(const Address& from, I128 amount) {
    transact("fund_pool", [&] {
        settlement_.fund_pool(from, amount);
    });
}

void Ledger::withdraw_pool(const Address& to, I128 amount, const Address& caller) {
    transact("withdraw_pool", [&] {
        settlement_.withdraw_pool(to, amount, caller);
    });
}

I128 Ledger::withdraw_commission(const Address& caller) {
    return transact("withdraw_commission", [&] {
        return settlement_.withdraw_commission(caller);
    });
}

// =============================================================================
// Queries
// =============================================================================

Order Ledger::order(OrderId id) const {
    ReadScope scope(*this);
    return orders_.get(id);
}

Position Ledger::position(PositionId id) const {
    ReadScope scope(*this);
    return positions_.get(id);
}

Trigger Ledger::trigger(TriggerId id) const {
    ReadScope scope(*this);
    return triggers_.lookup(id);
}

std::vector<Trigger> Ledger::triggers_of(PositionId id) const {
    ReadScope scope(*this);
    return positions_.triggers_of(id);
}

std::vector<OrderId> Ledger::orders_of(const Address& account) const {
    ReadScope scope(*this);
    return index_.orders_of(account);
}

std::vector<PositionId> Ledger::positions_of(const Address& account) const {
    ReadScope scope(*this);
    return index_.positions_of(account);
}

I128 Ledger::accrued_commission(const Address& account) const {
    ReadScope scope(*this);
    return settlement_.accrued_commission(account);
}

I128 Ledger::pool_balance() const {
    ReadScope scope(*this);
    return settlement_.pool_balance();
}

AuditSnapshot Ledger::audit() const {
    ReadScope scope(*this);

    AuditSnapshot snapshot;
    snapshot.custodied = custody_.custodied();
    snapshot.order_locked = orders_.locked_value();
    snapshot.position_margin = positions_.locked_margin();
    snapshot.accrued = settlement_.total_accrued();
    snapshot.pool = settlement_.pool_balance();
    return snapshot;
}

LedgerStats Ledger::stats() const {
    ReadScope scope(*this);

    LedgerStats stats;
    stats.live_orders = orders_.size();
    stats.live_positions = positions_.size();
    stats.live_triggers = triggers_.size();
    stats.orders_created = orders_.last_id();
    stats.positions_opened = positions_.last_id();
    stats.positions_closed = settlement_.positions_closed();
    stats.events_emitted = next_sequence_ - 1;
    stats.commission_accrued = settlement_.commission_accrued_total();
    return stats;
}

} // namespace perp::ledger
