// Perp Ledger - Trader Index Implementation

#include <perp/ledger/trader_index.hpp>

namespace perp::ledger {

void TraderIndex::add_order(const Address& account, OrderId id) {
    entries_[account].orders.insert(id);
}

void TraderIndex::remove_order(const Address& account, OrderId id) noexcept {
    auto it = entries_.find(account);
    if (it == entries_.end()) return;
    it->second.orders.erase(id);
    prune(it);
}

void TraderIndex::add_position(const Address& account, PositionId id) {
    entries_[account].positions.insert(id);
}

void TraderIndex::remove_position(const Address& account, PositionId id) noexcept {
    auto it = entries_.find(account);
    if (it == entries_.end()) return;
    it->second.positions.erase(id);
    prune(it);
}

std::vector<OrderId> TraderIndex::orders_of(const Address& account) const {
    auto it = entries_.find(account);
    if (it == entries_.end()) return {};
    return {it->second.orders.begin(), it->second.orders.end()};
}

std::vector<PositionId> TraderIndex::positions_of(const Address& account) const {
    auto it = entries_.find(account);
    if (it == entries_.end()) return {};
    return {it->second.positions.begin(), it->second.positions.end()};
}

size_t TraderIndex::accounts() const noexcept {
    return entries_.size();
}

void TraderIndex::prune(std::map<Address, Entry>::iterator it) noexcept {
    if (it->second.orders.empty() && it->second.positions.empty()) {
        entries_.erase(it);
    }
}

} // namespace perp::ledger
