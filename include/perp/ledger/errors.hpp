// Perp Ledger - Errors
// Every rejected ledger operation throws LedgerError and leaves state untouched

#ifndef PERP_LEDGER_ERRORS_HPP
#define PERP_LEDGER_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace perp::ledger {

enum class ErrorCode : uint8_t {
    OrderNotFound = 1,
    PositionNotFound = 2,
    TriggerNotFound = 3,
    NotAuthorized = 10,
    InvalidParameter = 11,
    InsufficientFunds = 12,
    TransferFailed = 13,
    IdCollision = 14,
    OnlyConditionalCancelable = 15,
    Reentrancy = 20
};

inline constexpr const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::OrderNotFound: return "order_not_found";
        case ErrorCode::PositionNotFound: return "position_not_found";
        case ErrorCode::TriggerNotFound: return "trigger_not_found";
        case ErrorCode::NotAuthorized: return "not_authorized";
        case ErrorCode::InvalidParameter: return "invalid_parameter";
        case ErrorCode::InsufficientFunds: return "insufficient_funds";
        case ErrorCode::TransferFailed: return "transfer_failed";
        case ErrorCode::IdCollision: return "id_collision";
        case ErrorCode::OnlyConditionalCancelable: return "only_conditional_cancelable";
        case ErrorCode::Reentrancy: return "reentrancy";
    }
    return "unknown";
}

inline constexpr bool is_not_found(ErrorCode code) noexcept {
    return code == ErrorCode::OrderNotFound ||
           code == ErrorCode::PositionNotFound ||
           code == ErrorCode::TriggerNotFound;
}

class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Raised while loading or validating configuration
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace perp::ledger

#endif // PERP_LEDGER_ERRORS_HPP
