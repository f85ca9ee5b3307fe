// Perp Ledger - Test Helpers

#ifndef PERP_LEDGER_TESTS_SUPPORT_HPP
#define PERP_LEDGER_TESTS_SUPPORT_HPP

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_tostring.hpp>
#include <perp/ledger/errors.hpp>
#include <perp/ledger/ledger.hpp>
#include <functional>
#include <string>

namespace Catch {

template <>
struct StringMaker<__int128> {
    static std::string convert(__int128 value) {
        return perp::ledger::x18::to_string(value);
    }
};

} // namespace Catch

namespace perp::ledger::testing {

constexpr Address EXECUTOR = address::from_index(0x0E);
constexpr Address RECEIVER = address::from_index(0x0C);
constexpr Address ALICE = address::from_index(0xA1);
constexpr Address BOB = address::from_index(0xB0);
constexpr Address FUNDER = address::from_index(0xF0);

inline I128 units(int64_t v) {
    return x18::from_int(v);
}

// Runs fn and returns the code of the LedgerError it throws
inline ErrorCode code_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const LedgerError& e) {
        return e.code();
    }
    FAIL("expected LedgerError");
    return ErrorCode::InvalidParameter;
}

inline LedgerConfig test_config() {
    return LedgerConfig()
        .with_executor(EXECUTOR)
        .with_commission_receiver(RECEIVER)
        .with_log_level("off");
}

// Market long: margin 1000, commission 10, leverage 10
inline OrderRequest market_long(const Address& owner = ALICE) {
    OrderRequest request;
    request.owner = owner;
    request.asset = 1;
    request.side = Side::Long;
    request.margin = units(1000);
    request.commission = units(10);
    request.size = units(10);
    request.leverage = 10;
    return request;
}

inline OrderRequest limit_short(const Address& owner = ALICE) {
    OrderRequest request = market_long(owner);
    request.side = Side::Short;
    request.target_price = units(105);
    return request;
}

// InMemoryToken that can deny pushes and run a hook inside every transfer
class TestToken : public InMemoryToken {
public:
    bool deny_pull = false;
    bool deny_push = false;
    std::function<void()> on_transfer;

    bool pull(const Address& from, I128 amount) override {
        if (on_transfer) on_transfer();
        if (deny_pull) return false;
        return InMemoryToken::pull(from, amount);
    }

    bool push(const Address& to, I128 amount) override {
        if (on_transfer) on_transfer();
        if (deny_push) return false;
        return InMemoryToken::push(to, amount);
    }
};

// Ledger over a TestToken with funded traders and a fixed clock
struct LedgerFixture {
    TestToken token;
    RoleAccessPolicy access{std::vector<Address>{EXECUTOR}};
    uint64_t now = 1000;
    EventLog log;
    Ledger ledger{test_config(), token, access, [this] { return now; }};

    LedgerFixture() {
        token.mint(ALICE, units(100000));
        token.mint(BOB, units(100000));
        token.mint(FUNDER, units(100000));
        ledger.add_listener(&log);
    }

    PositionId open_long(I128 stop_loss = 0, I128 take_profit = 0) {
        OrderRequest request = market_long();
        request.stop_loss = stop_loss;
        request.take_profit = take_profit;
        OrderId order_id = ledger.create_order(request);
        return ledger.execute_order(order_id, units(100), now + 1, EXECUTOR);
    }

    // Custody held by the token must always match the ledger's own books
    bool conserved() const {
        AuditSnapshot snapshot = ledger.audit();
        return snapshot.balanced() && snapshot.custodied == token.custody_balance();
    }
};

} // namespace perp::ledger::testing

#endif // PERP_LEDGER_TESTS_SUPPORT_HPP
