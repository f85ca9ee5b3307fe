// Perp Ledger - Trigger Registry Implementation

#include <perp/ledger/trigger_registry.hpp>
#include <perp/ledger/errors.hpp>

namespace perp::ledger {

TriggerId TriggerRegistry::allocate(PositionId position_id, TriggerKind kind, I128 price) {
    if (price <= 0) {
        throw LedgerError(ErrorCode::InvalidParameter,
            std::string("trigger price must be positive for ") + to_string(kind));
    }

    TriggerId id = last_id_ + 1;
    if (triggers_.count(id) != 0) {
        throw LedgerError(ErrorCode::IdCollision, "trigger id " + std::to_string(id) + " already live");
    }

    triggers_.emplace(id, Trigger{id, position_id, kind, price});
    last_id_ = id;
    return id;
}

void TriggerRegistry::deallocate(TriggerId id) {
    if (triggers_.erase(id) == 0) {
        throw LedgerError(ErrorCode::TriggerNotFound, "trigger " + std::to_string(id) + " not found");
    }
}

const Trigger& TriggerRegistry::lookup(TriggerId id) const {
    auto it = triggers_.find(id);
    if (it == triggers_.end()) {
        throw LedgerError(ErrorCode::TriggerNotFound, "trigger " + std::to_string(id) + " not found");
    }
    return it->second;
}

} // namespace perp::ledger
