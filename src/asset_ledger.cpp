// Perp Ledger - Asset Custody Implementation

#include <perp/ledger/asset_ledger.hpp>
#include <perp/ledger/errors.hpp>

namespace perp::ledger {

void AssetLedger::deposit(const Address& from, I128 amount) {
    if (amount <= 0) {
        throw LedgerError(ErrorCode::InvalidParameter, "deposit amount must be positive");
    }

    if (!gateway_.pull(from, amount)) {
        logger_->warn("pull of {} from {} denied", x18::to_string(amount), address::to_hex(from));
        throw LedgerError(ErrorCode::TransferFailed,
            "transfer of " + x18::to_string(amount) + " from " + address::to_hex(from) + " denied");
    }

    deposited_ += amount;
    logger_->trace("pulled {} from {}", x18::to_string(amount), address::to_hex(from));
}

void AssetLedger::release(const Address& to, I128 amount) {
    if (amount <= 0) {
        throw LedgerError(ErrorCode::InvalidParameter, "release amount must be positive");
    }

    if (!gateway_.push(to, amount)) {
        logger_->warn("push of {} to {} denied", x18::to_string(amount), address::to_hex(to));
        throw LedgerError(ErrorCode::TransferFailed,
            "transfer of " + x18::to_string(amount) + " to " + address::to_hex(to) + " denied");
    }

    released_ += amount;
    logger_->trace("pushed {} to {}", x18::to_string(amount), address::to_hex(to));
}

} // namespace perp::ledger
