// Perp Ledger - Core Types
// Addresses, X18 fixed-point arithmetic and ledger records

#ifndef PERP_LEDGER_TYPES_HPP
#define PERP_LEDGER_TYPES_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace perp::ledger {

// =============================================================================
// Account Address (20 bytes, EVM style)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace address {

// Parses "0x" + 40 hex digits (prefix optional). Throws std::invalid_argument.
Address from_hex(std::string_view hex);

// Lowercase, 0x-prefixed
std::string to_hex(const Address& addr);

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// Address whose last two bytes hold `n`; handy for tests and tools
constexpr Address from_index(uint16_t n) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((n >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(n & 0xFF);
    return addr;
}

} // namespace address

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr I128 I128_MAX = static_cast<I128>((static_cast<U128>(1) << 127) - 1);

namespace x18 {

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

inline int64_t to_int(I128 v) {
    return static_cast<int64_t>(v / X18_ONE);
}

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

// floor(a * b / d) for a, b >= 0 and d > 0 without forming a * b.
// Splits a = q * d + r so the partial products stay far below 2^127
// for prices and fractions in the ledger's range.
inline I128 mul_div_down(I128 a, I128 b, I128 d) {
    I128 q = a / d;
    I128 r = a % d;
    return q * b + (r * b) / d;
}

inline I128 mul_down(I128 a, I128 b) {
    return mul_div_down(a, b, X18_ONE);
}

// Decimal string ("-12.5", "0.000001", "1000") -> X18, extra digits truncated.
// Throws std::invalid_argument on malformed input.
I128 from_string(std::string_view s);

// X18 -> shortest decimal string ("1010", "0.08", "-150.5")
std::string to_string(I128 v);

} // namespace x18

// =============================================================================
// Identifiers
// =============================================================================

using OrderId = uint64_t;
using PositionId = uint64_t;
using TriggerId = uint64_t;
using AssetId = uint32_t;

// Ids are issued from 1; zero marks "none"
constexpr uint64_t NO_ID = 0;

// =============================================================================
// Enums
// =============================================================================

enum class Side : uint8_t {
    Long = 0,
    Short = 1
};

inline constexpr const char* to_string(Side s) noexcept {
    return s == Side::Long ? "long" : "short";
}

enum class TriggerKind : uint8_t {
    StopLoss = 0,
    TakeProfit = 1,
    Liquidation = 2
};

inline constexpr const char* to_string(TriggerKind k) noexcept {
    switch (k) {
        case TriggerKind::StopLoss: return "stop_loss";
        case TriggerKind::TakeProfit: return "take_profit";
        case TriggerKind::Liquidation: return "liquidation";
    }
    return "unknown";
}

// =============================================================================
// Records
// =============================================================================

struct OrderRequest {
    Address owner{};
    AssetId asset = 0;
    Side side = Side::Long;
    I128 target_price = 0;   // 0 = market, otherwise limit
    I128 stop_loss = 0;      // 0 = none
    I128 take_profit = 0;    // 0 = none
    I128 commission = 0;
    I128 margin = 0;
    I128 size = 0;
    uint32_t leverage = 1;
};

struct Order {
    OrderId id = NO_ID;
    Address owner{};
    AssetId asset = 0;
    Side side = Side::Long;
    I128 target_price = 0;
    I128 stop_loss = 0;
    I128 take_profit = 0;
    I128 commission = 0;
    I128 margin = 0;
    I128 size = 0;
    uint32_t leverage = 1;
    uint64_t created_at = 0;

    [[nodiscard]] bool is_conditional() const noexcept { return target_price != 0; }
    [[nodiscard]] I128 locked_value() const noexcept { return margin + commission; }
};

struct Position {
    PositionId id = NO_ID;
    Address owner{};
    AssetId asset = 0;
    Side side = Side::Long;
    I128 open_price = 0;
    I128 margin = 0;
    I128 size = 0;
    uint32_t leverage = 1;
    uint64_t opened_at = 0;
    I128 liquidation_price = 0;
    TriggerId stop_loss_id = NO_ID;
    TriggerId take_profit_id = NO_ID;
    TriggerId liquidation_id = NO_ID;

    [[nodiscard]] TriggerId trigger_id(TriggerKind kind) const noexcept {
        switch (kind) {
            case TriggerKind::StopLoss: return stop_loss_id;
            case TriggerKind::TakeProfit: return take_profit_id;
            case TriggerKind::Liquidation: return liquidation_id;
        }
        return NO_ID;
    }
};

struct Trigger {
    TriggerId id = NO_ID;
    PositionId position_id = NO_ID;
    TriggerKind kind = TriggerKind::StopLoss;
    I128 price = 0;
};

} // namespace perp::ledger

#endif // PERP_LEDGER_TYPES_HPP
