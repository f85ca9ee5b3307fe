// Perp Ledger - External Collaborators
// Value-transfer and access-control seams consumed by the ledger

#ifndef PERP_LEDGER_GATEWAY_HPP
#define PERP_LEDGER_GATEWAY_HPP

#include <perp/ledger/types.hpp>
#include <map>
#include <mutex>
#include <vector>

namespace perp::ledger {

// Fungible-asset transfer primitive. Returning false denies the transfer.
class TransferGateway {
public:
    virtual ~TransferGateway() = default;

    // Move `amount` from `from` into ledger custody
    virtual bool pull(const Address& from, I128 amount) = 0;

    // Move `amount` out of ledger custody to `to`
    virtual bool push(const Address& to, I128 amount) = 0;
};

// Resolves caller roles for every mutating operation
class AccessPolicy {
public:
    virtual ~AccessPolicy() = default;

    virtual bool is_executor(const Address& caller) const = 0;

    virtual bool is_owner(const Address& caller, const Address& owner) const {
        return caller == owner;
    }
};

// Executors listed up front (typically RolesConfig::executors)
class RoleAccessPolicy : public AccessPolicy {
public:
    explicit RoleAccessPolicy(std::vector<Address> executors);

    bool is_executor(const Address& caller) const override;

private:
    std::vector<Address> executors_;
};

// In-process token with balances and a custody account. Thread-safe.
class InMemoryToken : public TransferGateway {
public:
    InMemoryToken() = default;

    InMemoryToken(const InMemoryToken&) = delete;
    InMemoryToken& operator=(const InMemoryToken&) = delete;

    bool pull(const Address& from, I128 amount) override;
    bool push(const Address& to, I128 amount) override;

    void mint(const Address& to, I128 amount);

    [[nodiscard]] I128 balance_of(const Address& account) const;
    [[nodiscard]] I128 custody_balance() const;
    [[nodiscard]] I128 total_supply() const;

private:
    mutable std::mutex mutex_;
    std::map<Address, I128> balances_;
    I128 custody_ = 0;
    I128 supply_ = 0;
};

} // namespace perp::ledger

#endif // PERP_LEDGER_GATEWAY_HPP
