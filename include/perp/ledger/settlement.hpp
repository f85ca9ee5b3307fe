// Perp Ledger - Settlement Engine
// Order -> position conversion, trigger updates, position close and the pnl bank

#ifndef PERP_LEDGER_SETTLEMENT_HPP
#define PERP_LEDGER_SETTLEMENT_HPP

#include <perp/ledger/asset_ledger.hpp>
#include <perp/ledger/config.hpp>
#include <perp/ledger/events.hpp>
#include <perp/ledger/gateway.hpp>
#include <perp/ledger/log.hpp>
#include <perp/ledger/order_book.hpp>
#include <perp/ledger/position_book.hpp>
#include <perp/ledger/types.hpp>
#include <map>

namespace perp::ledger {

// Liquidation happens once `threshold` of the initial margin is lost, i.e.
// after an adverse move of threshold / leverage. The move is rounded down so
// the trader never gets more headroom than the threshold allows; long prices
// are floored at params.min_liquidation_price.
[[nodiscard]] I128 liquidation_price(Side side, I128 open_price, uint32_t leverage,
                                     const RiskParams& params);

struct CloseResult {
    I128 payout = 0;            // released to the owner
    I128 pool_delta = 0;        // signed change of the pool balance
    I128 uncollected_loss = 0;  // loss exceeding net margin, written off
};

// Not synchronized; the owning Ledger serializes access.
class SettlementEngine {
public:
    SettlementEngine(OrderBook& orders, PositionBook& positions, AssetLedger& custody,
                     const AccessPolicy& access, EventQueue& events,
                     const LedgerConfig& config);

    SettlementEngine(const SettlementEngine&) = delete;
    SettlementEngine& operator=(const SettlementEngine&) = delete;

    // Executor only. Consumes the order and opens a position in one step.
    [[nodiscard]] PositionId execute(OrderId order_id, I128 open_price, uint64_t opened_at,
                                     const Address& caller);

    // Owner or executor. price == 0 clears; kind must not be Liquidation.
    void set_trigger(PositionId position_id, TriggerKind kind, I128 price, const Address& caller);

    // Executor only. Settles all of the position's margin.
    CloseResult close(PositionId position_id, I128 pnl, I128 closing_commission, const Address& caller);

    // =========================================================================
    // Pool (pnl bank) and commission balances
    // =========================================================================

    void fund_pool(const Address& from, I128 amount);
    void withdraw_pool(const Address& to, I128 amount, const Address& caller);

    // Releases the caller's whole accrued balance
    I128 withdraw_commission(const Address& caller);

    [[nodiscard]] I128 pool_balance() const noexcept { return pool_; }
    [[nodiscard]] I128 accrued_commission(const Address& account) const;
    [[nodiscard]] I128 total_accrued() const noexcept;
    [[nodiscard]] const Address& commission_receiver() const noexcept { return receiver_; }

    // Counters
    [[nodiscard]] uint64_t positions_closed() const noexcept { return positions_closed_; }
    [[nodiscard]] I128 commission_accrued_total() const noexcept { return commission_accrued_total_; }

private:
    void require_executor(const Address& caller, const char* action) const;
    void accrue(const Address& account, I128 amount);

    OrderBook& orders_;
    PositionBook& positions_;
    AssetLedger& custody_;
    const AccessPolicy& access_;
    EventQueue& events_;

    RiskParams risk_;
    Address receiver_;

    std::map<Address, I128> accrued_;
    I128 pool_ = 0;

    uint64_t positions_closed_ = 0;
    I128 commission_accrued_total_ = 0;

    std::shared_ptr<spdlog::logger> logger_ = component_logger("settlement");
};

} // namespace perp::ledger

#endif // PERP_LEDGER_SETTLEMENT_HPP
