// Perp Ledger - Trader Index
// Non-owning account -> order ids / position ids listing

#ifndef PERP_LEDGER_TRADER_INDEX_HPP
#define PERP_LEDGER_TRADER_INDEX_HPP

#include <perp/ledger/types.hpp>
#include <map>
#include <set>
#include <vector>

namespace perp::ledger {

class TraderIndex {
public:
    void add_order(const Address& account, OrderId id);
    void remove_order(const Address& account, OrderId id) noexcept;

    void add_position(const Address& account, PositionId id);
    void remove_position(const Address& account, PositionId id) noexcept;

    // Ascending ids
    [[nodiscard]] std::vector<OrderId> orders_of(const Address& account) const;
    [[nodiscard]] std::vector<PositionId> positions_of(const Address& account) const;

    [[nodiscard]] size_t accounts() const noexcept;

private:
    struct Entry {
        std::set<OrderId> orders;
        std::set<PositionId> positions;
    };

    void prune(std::map<Address, Entry>::iterator it) noexcept;

    std::map<Address, Entry> entries_;
};

} // namespace perp::ledger

#endif // PERP_LEDGER_TRADER_INDEX_HPP
