// Perp Ledger - Position Book
// Open positions, their immobilized margin and their trigger ids

#ifndef PERP_LEDGER_POSITION_BOOK_HPP
#define PERP_LEDGER_POSITION_BOOK_HPP

#include <perp/ledger/log.hpp>
#include <perp/ledger/trader_index.hpp>
#include <perp/ledger/trigger_registry.hpp>
#include <perp/ledger/types.hpp>
#include <map>
#include <utility>
#include <vector>

namespace perp::ledger {

// Not synchronized; the owning Ledger serializes access.
class PositionBook {
public:
    PositionBook(TriggerRegistry& triggers, TraderIndex& index);

    PositionBook(const PositionBook&) = delete;
    PositionBook& operator=(const PositionBook&) = delete;

    // Stores a position built from `order` and allocates its stop-loss and
    // take-profit (when the order carries them) and liquidation triggers.
    // All or nothing: on any failure no position or trigger remains.
    [[nodiscard]] PositionId open(const Order& order, I128 open_price, uint64_t opened_at,
                                  I128 liquidation_price);

    // Swaps the stop-loss or take-profit trigger. price == 0 clears it.
    // Returns {old_id, new_id}, NO_ID where absent. The liquidation
    // trigger is write-once and rejected with InvalidParameter.
    std::pair<TriggerId, TriggerId> replace_trigger(PositionId id, TriggerKind kind, I128 price);

    // Removes the position, its index entry and every live trigger it owns
    Position remove(PositionId id);

    // Throws LedgerError(PositionNotFound)
    [[nodiscard]] const Position& get(PositionId id) const;

    [[nodiscard]] std::vector<Trigger> triggers_of(PositionId id) const;

    [[nodiscard]] bool contains(PositionId id) const noexcept { return positions_.count(id) != 0; }
    [[nodiscard]] size_t size() const noexcept { return positions_.size(); }
    [[nodiscard]] PositionId last_id() const noexcept { return last_id_; }

    // Sum of margin over live positions
    [[nodiscard]] I128 locked_margin() const noexcept;

    [[nodiscard]] std::vector<Position> all() const;

private:
    Position& find(PositionId id);

    TriggerRegistry& triggers_;
    TraderIndex& index_;

    std::map<PositionId, Position> positions_;
    PositionId last_id_ = NO_ID;

    std::shared_ptr<spdlog::logger> logger_ = component_logger("positions");
};

} // namespace perp::ledger

#endif // PERP_LEDGER_POSITION_BOOK_HPP
