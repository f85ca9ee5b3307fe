// Perp Ledger - Asset Custody
// The only component that moves value across the ledger boundary

#ifndef PERP_LEDGER_ASSET_LEDGER_HPP
#define PERP_LEDGER_ASSET_LEDGER_HPP

#include <perp/ledger/gateway.hpp>
#include <perp/ledger/log.hpp>
#include <perp/ledger/types.hpp>

namespace perp::ledger {

// Not synchronized; the owning Ledger serializes access.
class AssetLedger {
public:
    explicit AssetLedger(TransferGateway& gateway) : gateway_(gateway) {}

    AssetLedger(const AssetLedger&) = delete;
    AssetLedger& operator=(const AssetLedger&) = delete;

    // Pull into custody. Throws LedgerError(InvalidParameter | TransferFailed).
    void deposit(const Address& from, I128 amount);

    // Push out of custody. Throws LedgerError(InvalidParameter | TransferFailed).
    void release(const Address& to, I128 amount);

    [[nodiscard]] I128 total_deposited() const noexcept { return deposited_; }
    [[nodiscard]] I128 total_released() const noexcept { return released_; }
    [[nodiscard]] I128 custodied() const noexcept { return deposited_ - released_; }

private:
    TransferGateway& gateway_;
    I128 deposited_ = 0;
    I128 released_ = 0;

    std::shared_ptr<spdlog::logger> logger_ = component_logger("custody");
};

} // namespace perp::ledger

#endif // PERP_LEDGER_ASSET_LEDGER_HPP
