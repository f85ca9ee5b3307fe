// Perp Ledger - Order Book Tests

#include "test_support.hpp"
#include <catch2/catch_test_macros.hpp>
#include <perp/ledger/log.hpp>
#include <perp/ledger/order_book.hpp>

using namespace perp::ledger;
using namespace perp::ledger::testing;

namespace {

struct BookFixture {
    InMemoryToken token;
    AssetLedger custody{token};
    TraderIndex index;
    RoleAccessPolicy access{std::vector<Address>{EXECUTOR}};
    EventQueue events;
    OrderBook book{custody, index, access, events};

    BookFixture() {
        token.mint(ALICE, units(5000));
        spdlog::set_level(spdlog::level::off);
    }
};

}  // namespace

TEST_CASE("Order creation", "[orders]") {
    BookFixture f;

    SECTION("Locks margin plus commission") {
        OrderId id = f.book.create(market_long(), 100);

        REQUIRE(id == 1);
        REQUIRE(f.token.balance_of(ALICE) == units(3990));
        REQUIRE(f.token.custody_balance() == units(1010));
        REQUIRE(f.custody.custodied() == units(1010));
        REQUIRE(f.book.locked_value() == units(1010));
        REQUIRE(f.index.orders_of(ALICE) == std::vector<OrderId>{id});

        const Order& order = f.book.get(id);
        REQUIRE(order.owner == ALICE);
        REQUIRE(order.margin == units(1000));
        REQUIRE(order.commission == units(10));
        REQUIRE(order.leverage == 10);
        REQUIRE(order.created_at == 100);

        auto pending = f.events.drain();
        REQUIRE(pending.size() == 1);
        REQUIRE(std::holds_alternative<OrderCreated>(pending[0]));
    }

    SECTION("Ids increase monotonically") {
        OrderId a = f.book.create(market_long(), 100);
        OrderId b = f.book.create(limit_short(), 100);
        REQUIRE(b == a + 1);
        REQUIRE(f.book.size() == 2);
    }

    SECTION("Invalid parameters are rejected before any transfer") {
        OrderRequest zero_margin = market_long();
        zero_margin.margin = 0;
        OrderRequest zero_size = market_long();
        zero_size.size = 0;
        OrderRequest zero_leverage = market_long();
        zero_leverage.leverage = 0;
        OrderRequest negative_commission = market_long();
        negative_commission.commission = -1;
        OrderRequest negative_stop = market_long();
        negative_stop.stop_loss = -units(1);

        for (const auto& request : {zero_margin, zero_size, zero_leverage, negative_commission, negative_stop}) {
            REQUIRE(code_of([&] { (void)f.book.create(request, 100); }) == ErrorCode::InvalidParameter);
        }
        REQUIRE(f.token.balance_of(ALICE) == units(5000));
        REQUIRE(f.book.size() == 0);
        REQUIRE(f.events.empty());
    }

    SECTION("Denied deposit leaves no trace") {
        OrderRequest request = market_long(BOB);  // BOB holds nothing
        REQUIRE(code_of([&] { (void)f.book.create(request, 100); }) == ErrorCode::TransferFailed);

        REQUIRE(f.book.size() == 0);
        REQUIRE(f.book.last_id() == NO_ID);
        REQUIRE(f.index.orders_of(BOB).empty());
        REQUIRE(f.custody.custodied() == 0);
        REQUIRE(f.events.empty());
    }
}

TEST_CASE("Order cancellation", "[orders]") {
    BookFixture f;

    SECTION("Owner cancels a limit order for a full refund") {
        OrderId id = f.book.create(limit_short(), 100);
        f.events.clear();

        I128 refund = f.book.cancel(id, ALICE);

        REQUIRE(refund == units(1010));
        REQUIRE(f.token.balance_of(ALICE) == units(5000));
        REQUIRE(f.custody.custodied() == 0);
        REQUIRE_FALSE(f.book.contains(id));
        REQUIRE(f.index.orders_of(ALICE).empty());

        auto pending = f.events.drain();
        REQUIRE(pending.size() == 1);
        const auto& cancelled = std::get<OrderCancelled>(pending[0]);
        REQUIRE(cancelled.order_id == id);
        REQUIRE(cancelled.cancelled_by == ALICE);
        REQUIRE(cancelled.refund == units(1010));
    }

    SECTION("Executor may cancel") {
        OrderId id = f.book.create(limit_short(), 100);
        REQUIRE(f.book.cancel(id, EXECUTOR) == units(1010));
        REQUIRE(f.token.balance_of(ALICE) == units(5000));
    }

    SECTION("Market orders cannot be cancelled") {
        OrderId id = f.book.create(market_long(), 100);
        REQUIRE(code_of([&] { f.book.cancel(id, ALICE); }) == ErrorCode::OnlyConditionalCancelable);
        REQUIRE(f.book.contains(id));
    }

    SECTION("Strangers cannot cancel") {
        OrderId id = f.book.create(limit_short(), 100);
        REQUIRE(code_of([&] { f.book.cancel(id, BOB); }) == ErrorCode::NotAuthorized);
        REQUIRE(f.book.contains(id));
        REQUIRE(f.custody.custodied() == units(1010));
    }

    SECTION("Unknown order") {
        REQUIRE(code_of([&] { f.book.cancel(99, ALICE); }) == ErrorCode::OrderNotFound);
    }

    SECTION("Cancelled order ids are not reissued") {
        OrderId first = f.book.create(limit_short(), 100);
        f.book.cancel(first, ALICE);
        OrderId second = f.book.create(limit_short(), 100);
        REQUIRE(second > first);
        REQUIRE(code_of([&] { (void)f.book.get(first); }) == ErrorCode::OrderNotFound);
    }
}

TEST_CASE("Order removal keeps value in custody", "[orders]") {
    BookFixture f;
    OrderId id = f.book.create(market_long(), 100);

    Order removed = f.book.remove(id);

    REQUIRE(removed.id == id);
    REQUIRE_FALSE(f.book.contains(id));
    REQUIRE(f.index.orders_of(ALICE).empty());
    REQUIRE(f.custody.custodied() == units(1010));
    REQUIRE(code_of([&] { (void)f.book.remove(id); }) == ErrorCode::OrderNotFound);
}
