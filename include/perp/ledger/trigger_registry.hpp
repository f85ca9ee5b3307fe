// Perp Ledger - Trigger Registry
// One monotonic id space shared by stop-loss, take-profit and liquidation triggers

#ifndef PERP_LEDGER_TRIGGER_REGISTRY_HPP
#define PERP_LEDGER_TRIGGER_REGISTRY_HPP

#include <perp/ledger/types.hpp>
#include <unordered_map>

namespace perp::ledger {

// Ids are never reused and a trigger's price never changes in place:
// updating means deallocate(old) + allocate(new). Not synchronized.
class TriggerRegistry {
public:
    TriggerRegistry() = default;

    TriggerRegistry(const TriggerRegistry&) = delete;
    TriggerRegistry& operator=(const TriggerRegistry&) = delete;

    // Throws LedgerError(InvalidParameter) if price <= 0, IdCollision if the
    // next slot is occupied
    [[nodiscard]] TriggerId allocate(PositionId position_id, TriggerKind kind, I128 price);

    // Throws LedgerError(TriggerNotFound)
    void deallocate(TriggerId id);

    // Throws LedgerError(TriggerNotFound)
    [[nodiscard]] const Trigger& lookup(TriggerId id) const;

    [[nodiscard]] bool contains(TriggerId id) const noexcept { return triggers_.count(id) != 0; }
    [[nodiscard]] size_t size() const noexcept { return triggers_.size(); }

    // Highest id ever issued (NO_ID before the first allocation)
    [[nodiscard]] TriggerId last_id() const noexcept { return last_id_; }

private:
    std::unordered_map<TriggerId, Trigger> triggers_;
    TriggerId last_id_ = NO_ID;
};

} // namespace perp::ledger

#endif // PERP_LEDGER_TRIGGER_REGISTRY_HPP
