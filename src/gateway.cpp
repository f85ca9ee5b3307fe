// Perp Ledger - Collaborator Implementations

#include <perp/ledger/gateway.hpp>
#include <algorithm>

namespace perp::ledger {

// =============================================================================
// RoleAccessPolicy
// =============================================================================

RoleAccessPolicy::RoleAccessPolicy(std::vector<Address> executors)
    : executors_(std::move(executors)) {}

bool RoleAccessPolicy::is_executor(const Address& caller) const {
    return std::find(executors_.begin(), executors_.end(), caller) != executors_.end();
}

// =============================================================================
// InMemoryToken
// =============================================================================

bool InMemoryToken::pull(const Address& from, I128 amount) {
    if (amount <= 0) return false;

    std::lock_guard lock(mutex_);
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    it->second -= amount;
    custody_ += amount;
    return true;
}

bool InMemoryToken::push(const Address& to, I128 amount) {
    if (amount <= 0) return false;

    std::lock_guard lock(mutex_);
    if (custody_ < amount) {
        return false;
    }
    custody_ -= amount;
    balances_[to] += amount;
    return true;
}

void InMemoryToken::mint(const Address& to, I128 amount) {
    std::lock_guard lock(mutex_);
    balances_[to] += amount;
    supply_ += amount;
}

I128 InMemoryToken::balance_of(const Address& account) const {
    std::lock_guard lock(mutex_);
    auto it = balances_.find(account);
    return (it != balances_.end()) ? it->second : 0;
}

I128 InMemoryToken::custody_balance() const {
    std::lock_guard lock(mutex_);
    return custody_;
}

I128 InMemoryToken::total_supply() const {
    std::lock_guard lock(mutex_);
    return supply_;
}

} // namespace perp::ledger
