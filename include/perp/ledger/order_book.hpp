// Perp Ledger - Order Book
// Pending orders and the margin + commission locked for each

#ifndef PERP_LEDGER_ORDER_BOOK_HPP
#define PERP_LEDGER_ORDER_BOOK_HPP

#include <perp/ledger/asset_ledger.hpp>
#include <perp/ledger/events.hpp>
#include <perp/ledger/gateway.hpp>
#include <perp/ledger/log.hpp>
#include <perp/ledger/trader_index.hpp>
#include <perp/ledger/types.hpp>
#include <map>
#include <vector>

namespace perp::ledger {

// Not synchronized; the owning Ledger serializes access.
class OrderBook {
public:
    OrderBook(AssetLedger& custody, TraderIndex& index, const AccessPolicy& access, EventQueue& events);

    OrderBook(const OrderBook&) = delete;
    OrderBook& operator=(const OrderBook&) = delete;

    // Validates the request, pulls margin + commission from the owner and
    // stores the order. Nothing is stored if the pull is denied.
    [[nodiscard]] OrderId create(const OrderRequest& request, uint64_t created_at);

    // Refunds margin + commission to the owner and removes the order.
    // Only conditional (limit) orders, only by the owner or an executor.
    I128 cancel(OrderId id, const Address& caller);

    // Removes without any transfer; the locked value stays in custody.
    // Throws LedgerError(OrderNotFound).
    Order remove(OrderId id);

    // Throws LedgerError(OrderNotFound)
    [[nodiscard]] const Order& get(OrderId id) const;

    [[nodiscard]] bool contains(OrderId id) const noexcept { return orders_.count(id) != 0; }
    [[nodiscard]] size_t size() const noexcept { return orders_.size(); }
    [[nodiscard]] OrderId last_id() const noexcept { return last_id_; }

    // Sum of margin + commission over live orders
    [[nodiscard]] I128 locked_value() const noexcept;

    [[nodiscard]] std::vector<Order> all() const;

private:
    static void validate(const OrderRequest& request);

    AssetLedger& custody_;
    TraderIndex& index_;
    const AccessPolicy& access_;
    EventQueue& events_;

    std::map<OrderId, Order> orders_;
    OrderId last_id_ = NO_ID;

    std::shared_ptr<spdlog::logger> logger_ = component_logger("orders");
};

} // namespace perp::ledger

#endif // PERP_LEDGER_ORDER_BOOK_HPP
