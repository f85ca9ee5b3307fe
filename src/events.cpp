// Perp Ledger - Events Implementation

#include <perp/ledger/events.hpp>
#include <nlohmann/json.hpp>

namespace perp::ledger {

using json = nlohmann::json;

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string amount(I128 v) {
    return x18::to_string(v);
}

json order_json(const Order& o) {
    return json{
        {"order_id", o.id},
        {"owner", address::to_hex(o.owner)},
        {"asset", o.asset},
        {"side", to_string(o.side)},
        {"target_price", amount(o.target_price)},
        {"stop_loss", amount(o.stop_loss)},
        {"take_profit", amount(o.take_profit)},
        {"commission", amount(o.commission)},
        {"margin", amount(o.margin)},
        {"size", amount(o.size)},
        {"leverage", o.leverage},
        {"created_at", o.created_at}
    };
}

json position_json(const Position& p) {
    return json{
        {"position_id", p.id},
        {"owner", address::to_hex(p.owner)},
        {"asset", p.asset},
        {"side", to_string(p.side)},
        {"open_price", amount(p.open_price)},
        {"margin", amount(p.margin)},
        {"size", amount(p.size)},
        {"leverage", p.leverage},
        {"opened_at", p.opened_at},
        {"liquidation_price", amount(p.liquidation_price)},
        {"stop_loss_id", p.stop_loss_id},
        {"take_profit_id", p.take_profit_id},
        {"liquidation_id", p.liquidation_id}
    };
}

}  // namespace

const char* event_name(const EventPayload& payload) {
    return std::visit(overloaded{
        [](const OrderCreated&) { return "order_created"; },
        [](const OrderCancelled&) { return "order_cancelled"; },
        [](const PositionOpened&) { return "position_opened"; },
        [](const TriggerSet&) { return "trigger_set"; },
        [](const TriggerChanged&) { return "trigger_changed"; },
        [](const TriggerRemoved&) { return "trigger_removed"; },
        [](const PositionClosed&) { return "position_closed"; },
        [](const PoolFunded&) { return "pool_funded"; },
        [](const PoolWithdrawn&) { return "pool_withdrawn"; },
        [](const CommissionWithdrawn&) { return "commission_withdrawn"; }
    }, payload);
}

json to_json(const LedgerEvent& event) {
    json body = std::visit(overloaded{
        [](const OrderCreated& e) {
            return order_json(e.order);
        },
        [](const OrderCancelled& e) {
            return json{
                {"order_id", e.order_id},
                {"owner", address::to_hex(e.owner)},
                {"cancelled_by", address::to_hex(e.cancelled_by)},
                {"refund", amount(e.refund)}
            };
        },
        [](const PositionOpened& e) {
            json j = position_json(e.position);
            j["order_id"] = e.order_id;
            j["commission_accrued"] = amount(e.commission_accrued);
            return j;
        },
        [](const TriggerSet& e) {
            return json{
                {"trigger_id", e.trigger_id},
                {"position_id", e.position_id},
                {"kind", to_string(e.kind)},
                {"price", amount(e.price)}
            };
        },
        [](const TriggerChanged& e) {
            return json{
                {"position_id", e.position_id},
                {"kind", to_string(e.kind)},
                {"old_id", e.old_id},
                {"new_id", e.new_id}
            };
        },
        [](const TriggerRemoved& e) {
            return json{
                {"trigger_id", e.trigger_id},
                {"position_id", e.position_id},
                {"kind", to_string(e.kind)}
            };
        },
        [](const PositionClosed& e) {
            return json{
                {"position_id", e.position_id},
                {"owner", address::to_hex(e.owner)},
                {"pnl", amount(e.pnl)},
                {"closing_commission", amount(e.closing_commission)},
                {"payout", amount(e.payout)},
                {"pool_delta", amount(e.pool_delta)},
                {"uncollected_loss", amount(e.uncollected_loss)}
            };
        },
        [](const PoolFunded& e) {
            return json{
                {"from", address::to_hex(e.from)},
                {"amount", amount(e.amount)},
                {"pool_balance", amount(e.pool_balance)}
            };
        },
        [](const PoolWithdrawn& e) {
            return json{
                {"to", address::to_hex(e.to)},
                {"amount", amount(e.amount)},
                {"pool_balance", amount(e.pool_balance)}
            };
        },
        [](const CommissionWithdrawn& e) {
            return json{
                {"account", address::to_hex(e.account)},
                {"amount", amount(e.amount)}
            };
        }
    }, event.payload);

    body["seq"] = event.sequence;
    body["event"] = event_name(event.payload);
    return body;
}

// =============================================================================
// EventLog
// =============================================================================

void EventLog::on_event(const LedgerEvent& event) {
    std::lock_guard lock(mutex_);
    events_.push_back(event);
}

std::vector<LedgerEvent> EventLog::events() const {
    std::lock_guard lock(mutex_);
    return events_;
}

size_t EventLog::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

void EventLog::clear() {
    std::lock_guard lock(mutex_);
    events_.clear();
}

// =============================================================================
// JsonLinesWriter
// =============================================================================

void JsonLinesWriter::on_event(const LedgerEvent& event) {
    std::string line = to_json(event).dump();
    std::lock_guard lock(mutex_);
    out_ << line << '\n';
    out_.flush();
}

}  // namespace perp::ledger
