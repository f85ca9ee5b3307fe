// Perp Ledger - Position Book Implementation

#include <perp/ledger/position_book.hpp>
#include <perp/ledger/errors.hpp>

namespace perp::ledger {

PositionBook::PositionBook(TriggerRegistry& triggers, TraderIndex& index)
    : triggers_(triggers), index_(index) {}

PositionId PositionBook::open(const Order& order, I128 open_price, uint64_t opened_at,
                              I128 liquidation_price) {
    PositionId id = last_id_ + 1;
    if (positions_.count(id) != 0) {
        throw LedgerError(ErrorCode::IdCollision, "position id " + std::to_string(id) + " already live");
    }

    Position position;
    position.id = id;
    position.owner = order.owner;
    position.asset = order.asset;
    position.side = order.side;
    position.open_price = open_price;
    position.margin = order.margin;
    position.size = order.size;
    position.leverage = order.leverage;
    position.opened_at = opened_at;
    position.liquidation_price = liquidation_price;

    std::vector<TriggerId> allocated;
    allocated.reserve(3);

    try {
        if (order.stop_loss != 0) {
            position.stop_loss_id = triggers_.allocate(id, TriggerKind::StopLoss, order.stop_loss);
            allocated.push_back(position.stop_loss_id);
        }
        if (order.take_profit != 0) {
            position.take_profit_id = triggers_.allocate(id, TriggerKind::TakeProfit, order.take_profit);
            allocated.push_back(position.take_profit_id);
        }
        position.liquidation_id = triggers_.allocate(id, TriggerKind::Liquidation, liquidation_price);
        allocated.push_back(position.liquidation_id);

        positions_.emplace(id, position);
        index_.add_position(position.owner, id);
    } catch (...) {
        // Burnt trigger ids stay burnt; only the records are rolled back
        for (TriggerId trigger_id : allocated) {
            triggers_.deallocate(trigger_id);
        }
        positions_.erase(id);
        throw;
    }

    last_id_ = id;
    logger_->debug("opened position {} at {} liq {}", id, x18::to_string(open_price),
                   x18::to_string(liquidation_price));
    return id;
}

std::pair<TriggerId, TriggerId> PositionBook::replace_trigger(PositionId id, TriggerKind kind, I128 price) {
    if (kind == TriggerKind::Liquidation) {
        throw LedgerError(ErrorCode::InvalidParameter, "liquidation trigger cannot be replaced");
    }
    if (price < 0) {
        throw LedgerError(ErrorCode::InvalidParameter, "trigger price must not be negative");
    }

    Position& position = find(id);
    TriggerId& slot = (kind == TriggerKind::StopLoss) ? position.stop_loss_id : position.take_profit_id;

    TriggerId old_id = slot;
    TriggerId new_id = NO_ID;
    if (price > 0) {
        new_id = triggers_.allocate(id, kind, price);
    }
    if (old_id != NO_ID) {
        triggers_.deallocate(old_id);
    }
    slot = new_id;

    logger_->debug("{} of position {}: {} -> {}", to_string(kind), id, old_id, new_id);
    return {old_id, new_id};
}

Position PositionBook::remove(PositionId id) {
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        throw LedgerError(ErrorCode::PositionNotFound, "position " + std::to_string(id) + " not found");
    }

    Position position = it->second;
    const TriggerId owned[] = {position.stop_loss_id, position.take_profit_id, position.liquidation_id};

    // A referenced trigger that is no longer live fails the removal before
    // anything is erased
    for (TriggerId trigger_id : owned) {
        if (trigger_id != NO_ID) {
            (void)triggers_.lookup(trigger_id);
        }
    }
    for (TriggerId trigger_id : owned) {
        if (trigger_id != NO_ID) {
            triggers_.deallocate(trigger_id);
        }
    }
    index_.remove_position(position.owner, id);
    positions_.erase(it);
    return position;
}

const Position& PositionBook::get(PositionId id) const {
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        throw LedgerError(ErrorCode::PositionNotFound, "position " + std::to_string(id) + " not found");
    }
    return it->second;
}

Position& PositionBook::find(PositionId id) {
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        throw LedgerError(ErrorCode::PositionNotFound, "position " + std::to_string(id) + " not found");
    }
    return it->second;
}

std::vector<Trigger> PositionBook::triggers_of(PositionId id) const {
    const Position& position = get(id);

    std::vector<Trigger> out;
    for (TriggerId trigger_id : {position.stop_loss_id, position.take_profit_id, position.liquidation_id}) {
        if (trigger_id != NO_ID) {
            out.push_back(triggers_.lookup(trigger_id));
        }
    }
    return out;
}

I128 PositionBook::locked_margin() const noexcept {
    I128 total = 0;
    for (const auto& [id, position] : positions_) {
        total += position.margin;
    }
    return total;
}

std::vector<Position> PositionBook::all() const {
    std::vector<Position> out;
    out.reserve(positions_.size());
    for (const auto& [id, position] : positions_) {
        out.push_back(position);
    }
    return out;
}

} // namespace perp::ledger
