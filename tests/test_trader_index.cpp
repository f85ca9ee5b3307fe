// Perp Ledger - Trader Index Tests

#include "test_support.hpp"
#include <catch2/catch_test_macros.hpp>
#include <perp/ledger/trader_index.hpp>

using namespace perp::ledger;
using namespace perp::ledger::testing;

TEST_CASE("Trader index listings", "[index]") {
    TraderIndex index;

    SECTION("Ids are listed in ascending order per account") {
        index.add_order(ALICE, 5);
        index.add_order(ALICE, 2);
        index.add_order(BOB, 3);
        index.add_position(ALICE, 9);

        REQUIRE(index.orders_of(ALICE) == std::vector<OrderId>({2, 5}));
        REQUIRE(index.orders_of(BOB) == std::vector<OrderId>{3});
        REQUIRE(index.positions_of(ALICE) == std::vector<PositionId>{9});
        REQUIRE(index.positions_of(BOB).empty());
        REQUIRE(index.accounts() == 2);
    }

    SECTION("Unknown accounts list nothing") {
        REQUIRE(index.orders_of(ALICE).empty());
        REQUIRE(index.positions_of(ALICE).empty());
    }

    SECTION("Empty accounts are pruned") {
        index.add_order(ALICE, 1);
        index.add_position(ALICE, 1);

        index.remove_order(ALICE, 1);
        REQUIRE(index.accounts() == 1);

        index.remove_position(ALICE, 1);
        REQUIRE(index.accounts() == 0);
    }

    SECTION("Removing an absent id is harmless") {
        index.remove_order(BOB, 1);
        index.add_order(BOB, 1);
        index.remove_position(BOB, 1);
        REQUIRE(index.orders_of(BOB) == std::vector<OrderId>{1});
    }
}
