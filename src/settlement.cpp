// Perp Ledger - Settlement Engine Implementation

#include <perp/ledger/settlement.hpp>
#include <perp/ledger/errors.hpp>
#include <algorithm>

namespace perp::ledger {

// =============================================================================
// Liquidation Price
// =============================================================================

I128 liquidation_price(Side side, I128 open_price, uint32_t leverage, const RiskParams& params) {
    if (open_price <= 0) {
        throw LedgerError(ErrorCode::InvalidParameter, "open price must be positive");
    }
    if (leverage < 1) {
        throw LedgerError(ErrorCode::InvalidParameter, "leverage must be at least 1");
    }

    // Tolerated adverse move as an X18 fraction, rounded down
    I128 move = params.liquidation_threshold / static_cast<I128>(leverage);
    I128 delta = x18::mul_down(open_price, move);

    if (side == Side::Long) {
        return std::max(open_price - delta, params.min_liquidation_price);
    }
    return open_price + delta;
}

// =============================================================================
// Constructor
// =============================================================================

SettlementEngine::SettlementEngine(OrderBook& orders, PositionBook& positions, AssetLedger& custody,
                                   const AccessPolicy& access, EventQueue& events,
                                   const LedgerConfig& config)
    : orders_(orders),
      positions_(positions),
      custody_(custody),
      access_(access),
      events_(events),
      risk_(config.risk),
      receiver_(config.roles.commission_receiver) {}

// =============================================================================
// Order -> Position
// =============================================================================

PositionId SettlementEngine::execute(OrderId order_id, I128 open_price, uint64_t opened_at,
                                     const Address& caller) {
    require_executor(caller, "execute orders");

    const Order& order = orders_.get(order_id);
    if (open_price <= 0) {
        throw LedgerError(ErrorCode::InvalidParameter, "open price must be positive");
    }
    if (opened_at == 0 || opened_at < order.created_at) {
        throw LedgerError(ErrorCode::InvalidParameter,
            "open time " + std::to_string(opened_at) + " precedes order creation at " +
            std::to_string(order.created_at));
    }

    I128 liq_price = liquidation_price(order.side, open_price, order.leverage, risk_);

    // open() is all-or-nothing; once it returns nothing below can fail
    PositionId position_id = positions_.open(order, open_price, opened_at, liq_price);

    // Margin stays in custody as position margin; commission is now earned
    Order consumed = orders_.remove(order_id);
    accrue(receiver_, consumed.commission);

    const Position& position = positions_.get(position_id);
    events_.push(PositionOpened{position, order_id, consumed.commission});
    for (const Trigger& trigger : positions_.triggers_of(position_id)) {
        events_.push(TriggerSet{trigger.id, position_id, trigger.kind, trigger.price});
    }

    logger_->debug("order {} -> position {} ({} x{}, margin {})", order_id, position_id,
                   to_string(position.side), position.leverage, x18::to_string(position.margin));
    return position_id;
}

// =============================================================================
// Stop-Loss / Take-Profit
// =============================================================================

void SettlementEngine::set_trigger(PositionId position_id, TriggerKind kind, I128 price,
                                   const Address& caller) {
    const Position& position = positions_.get(position_id);
    if (!access_.is_owner(caller, position.owner) && !access_.is_executor(caller)) {
        throw LedgerError(ErrorCode::NotAuthorized,
            address::to_hex(caller) + " may not modify triggers of position " + std::to_string(position_id));
    }
    if (kind == TriggerKind::Liquidation) {
        throw LedgerError(ErrorCode::InvalidParameter, "liquidation trigger is write-once");
    }
    if (price < 0) {
        throw LedgerError(ErrorCode::InvalidParameter, "trigger price must not be negative");
    }

    // Clearing an absent trigger changes nothing
    if (price == 0 && position.trigger_id(kind) == NO_ID) {
        return;
    }

    auto [old_id, new_id] = positions_.replace_trigger(position_id, kind, price);

    events_.push(TriggerChanged{position_id, kind, old_id, new_id});
    if (new_id != NO_ID) {
        events_.push(TriggerSet{new_id, position_id, kind, price});
    }
}

// =============================================================================
// Close
// =============================================================================

CloseResult SettlementEngine::close(PositionId position_id, I128 pnl, I128 closing_commission,
                                    const Address& caller) {
    require_executor(caller, "close positions");

    const Position& position = positions_.get(position_id);
    if (closing_commission < 0) {
        throw LedgerError(ErrorCode::InvalidParameter, "closing commission must not be negative");
    }
    if (pnl < -I128_MAX) {
        throw LedgerError(ErrorCode::InvalidParameter, "pnl out of range");
    }
    if (closing_commission > position.margin) {
        throw LedgerError(ErrorCode::InsufficientFunds,
            "closing commission " + x18::to_string(closing_commission) +
            " exceeds margin " + x18::to_string(position.margin));
    }

    // Throws TriggerNotFound for a dangling trigger id before any transfer
    const std::vector<Trigger> owned = positions_.triggers_of(position_id);

    const I128 margin_net = position.margin - closing_commission;
    CloseResult result;

    if (pnl > 0) {
        if (pool_ < pnl) {
            throw LedgerError(ErrorCode::InsufficientFunds,
                "pool balance " + x18::to_string(pool_) + " cannot pay profit " + x18::to_string(pnl));
        }
        result.payout = margin_net + pnl;
        result.pool_delta = -pnl;
    } else if (pnl < 0) {
        // Trader liability is capped at the net margin; the rest is written off
        const I128 loss = -pnl;
        const I128 absorbed = std::min(loss, margin_net);
        result.payout = margin_net - absorbed;
        result.pool_delta = absorbed;
        result.uncollected_loss = loss - absorbed;
    } else {
        result.payout = margin_net;
    }

    const Address owner = position.owner;
    if (result.payout > 0) {
        custody_.release(owner, result.payout);
    }

    positions_.remove(position_id);
    accrue(receiver_, closing_commission);
    pool_ += result.pool_delta;
    ++positions_closed_;

    for (const Trigger& trigger : owned) {
        events_.push(TriggerRemoved{trigger.id, position_id, trigger.kind});
    }
    events_.push(PositionClosed{position_id, owner, pnl, closing_commission,
                                result.payout, result.pool_delta, result.uncollected_loss});

    if (result.uncollected_loss > 0) {
        logger_->info("position {} loss exceeds margin by {}, written off", position_id,
                      x18::to_string(result.uncollected_loss));
    }
    logger_->debug("closed position {} payout {} pool delta {}", position_id,
                   x18::to_string(result.payout), x18::to_string(result.pool_delta));
    return result;
}

// =============================================================================
// Pool and Commission Balances
// =============================================================================

void SettlementEngine::fund_pool(const Address& from, I128 amount) {
    if (amount <= 0) {
        throw LedgerError(ErrorCode::InvalidParameter, "pool funding must be positive");
    }

    custody_.deposit(from, amount);
    pool_ += amount;

    events_.push(PoolFunded{from, amount, pool_});
    logger_->debug("pool funded with {}, balance {}", x18::to_string(amount), x18::to_string(pool_));
}

void SettlementEngine::withdraw_pool(const Address& to, I128 amount, const Address& caller) {
    require_executor(caller, "withdraw from the pool");
    if (amount <= 0) {
        throw LedgerError(ErrorCode::InvalidParameter, "pool withdrawal must be positive");
    }
    if (pool_ < amount) {
        throw LedgerError(ErrorCode::InsufficientFunds,
            "pool balance " + x18::to_string(pool_) + " below " + x18::to_string(amount));
    }

    custody_.release(to, amount);
    pool_ -= amount;

    events_.push(PoolWithdrawn{to, amount, pool_});
    logger_->debug("pool withdrawal of {}, balance {}", x18::to_string(amount), x18::to_string(pool_));
}

I128 SettlementEngine::withdraw_commission(const Address& caller) {
    auto it = accrued_.find(caller);
    if (it == accrued_.end() || it->second <= 0) {
        throw LedgerError(ErrorCode::InsufficientFunds,
            "no accrued commission for " + address::to_hex(caller));
    }

    const I128 amount = it->second;
    custody_.release(caller, amount);
    accrued_.erase(it);

    events_.push(CommissionWithdrawn{caller, amount});
    logger_->debug("{} withdrew commission {}", address::to_hex(caller), x18::to_string(amount));
    return amount;
}

I128 SettlementEngine::accrued_commission(const Address& account) const {
    auto it = accrued_.find(account);
    return (it != accrued_.end()) ? it->second : 0;
}

I128 SettlementEngine::total_accrued() const noexcept {
    I128 total = 0;
    for (const auto& [account, balance] : accrued_) {
        total += balance;
    }
    return total;
}

// =============================================================================
// Internal Helpers
// =============================================================================

void SettlementEngine::require_executor(const Address& caller, const char* action) const {
    if (!access_.is_executor(caller)) {
        throw LedgerError(ErrorCode::NotAuthorized,
            address::to_hex(caller) + " may not " + action);
    }
}

void SettlementEngine::accrue(const Address& account, I128 amount) {
    if (amount == 0) return;
    accrued_[account] += amount;
    commission_accrued_total_ += amount;
}

} // namespace perp::ledger
