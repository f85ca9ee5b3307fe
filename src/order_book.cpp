// Perp Ledger - Order Book Implementation

#include <perp/ledger/order_book.hpp>
#include <perp/ledger/errors.hpp>

namespace perp::ledger {

OrderBook::OrderBook(AssetLedger& custody, TraderIndex& index, const AccessPolicy& access,
                     EventQueue& events)
    : custody_(custody), index_(index), access_(access), events_(events) {}

void OrderBook::validate(const OrderRequest& request) {
    if (request.margin <= 0) {
        throw LedgerError(ErrorCode::InvalidParameter, "margin must be positive");
    }
    if (request.size <= 0) {
        throw LedgerError(ErrorCode::InvalidParameter, "size must be positive");
    }
    if (request.leverage < 1) {
        throw LedgerError(ErrorCode::InvalidParameter, "leverage must be at least 1");
    }
    if (request.commission < 0) {
        throw LedgerError(ErrorCode::InvalidParameter, "commission must not be negative");
    }
    if (request.target_price < 0 || request.stop_loss < 0 || request.take_profit < 0) {
        throw LedgerError(ErrorCode::InvalidParameter, "prices must not be negative");
    }
}

OrderId OrderBook::create(const OrderRequest& request, uint64_t created_at) {
    validate(request);

    OrderId id = last_id_ + 1;
    if (orders_.count(id) != 0) {
        throw LedgerError(ErrorCode::IdCollision, "order id " + std::to_string(id) + " already live");
    }

    // Only external step; a denial throws before anything is recorded
    custody_.deposit(request.owner, request.margin + request.commission);

    Order order;
    order.id = id;
    order.owner = request.owner;
    order.asset = request.asset;
    order.side = request.side;
    order.target_price = request.target_price;
    order.stop_loss = request.stop_loss;
    order.take_profit = request.take_profit;
    order.commission = request.commission;
    order.margin = request.margin;
    order.size = request.size;
    order.leverage = request.leverage;
    order.created_at = created_at;

    orders_.emplace(id, order);
    index_.add_order(order.owner, id);
    last_id_ = id;

    events_.push(OrderCreated{order});
    logger_->debug("created order {} for {} locking {}", id, address::to_hex(order.owner),
                   x18::to_string(order.locked_value()));
    return id;
}

I128 OrderBook::cancel(OrderId id, const Address& caller) {
    auto it = orders_.find(id);
    if (it == orders_.end()) {
        throw LedgerError(ErrorCode::OrderNotFound, "order " + std::to_string(id) + " not found");
    }

    const Order& order = it->second;
    if (!order.is_conditional()) {
        throw LedgerError(ErrorCode::OnlyConditionalCancelable,
            "order " + std::to_string(id) + " is a market order and cannot be cancelled");
    }
    if (!access_.is_owner(caller, order.owner) && !access_.is_executor(caller)) {
        throw LedgerError(ErrorCode::NotAuthorized,
            address::to_hex(caller) + " may not cancel order " + std::to_string(id));
    }

    // Commission of a cancelled order was never earned: refund all of it
    const Address owner = order.owner;
    const I128 refund = order.locked_value();
    custody_.release(owner, refund);

    index_.remove_order(owner, id);
    orders_.erase(it);

    events_.push(OrderCancelled{id, owner, caller, refund});
    logger_->debug("cancelled order {} refunding {}", id, x18::to_string(refund));
    return refund;
}

Order OrderBook::remove(OrderId id) {
    auto it = orders_.find(id);
    if (it == orders_.end()) {
        throw LedgerError(ErrorCode::OrderNotFound, "order " + std::to_string(id) + " not found");
    }

    Order order = it->second;
    index_.remove_order(order.owner, id);
    orders_.erase(it);
    return order;
}

const Order& OrderBook::get(OrderId id) const {
    auto it = orders_.find(id);
    if (it == orders_.end()) {
        throw LedgerError(ErrorCode::OrderNotFound, "order " + std::to_string(id) + " not found");
    }
    return it->second;
}

I128 OrderBook::locked_value() const noexcept {
    I128 total = 0;
    for (const auto& [id, order] : orders_) {
        total += order.locked_value();
    }
    return total;
}

std::vector<Order> OrderBook::all() const {
    std::vector<Order> out;
    out.reserve(orders_.size());
    for (const auto& [id, order] : orders_) {
        out.push_back(order);
    }
    return out;
}

} // namespace perp::ledger
