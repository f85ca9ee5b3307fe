// Perp Ledger - Events Tests

#include "test_support.hpp"
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <perp/ledger/events.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace perp::ledger;
using namespace perp::ledger::testing;
using json = nlohmann::json;

TEST_CASE("Event JSON", "[events]") {
    SECTION("Position close carries amounts as decimal strings") {
        LedgerEvent event{7, PositionClosed{3, ALICE, -units(150), units(5), units(845), units(150), 0}};
        json j = to_json(event);

        REQUIRE(j["seq"] == 7);
        REQUIRE(j["event"] == "position_closed");
        REQUIRE(j["position_id"] == 3);
        REQUIRE(j["owner"] == address::to_hex(ALICE));
        REQUIRE(j["pnl"] == "-150");
        REQUIRE(j["payout"] == "845");
        REQUIRE(j["pool_delta"] == "150");
        REQUIRE(j["uncollected_loss"] == "0");
    }

    SECTION("Trigger change keeps both ids") {
        LedgerEvent event{1, TriggerChanged{4, TriggerKind::StopLoss, 5, 9}};
        json j = to_json(event);

        REQUIRE(j["event"] == "trigger_changed");
        REQUIRE(j["kind"] == "stop_loss");
        REQUIRE(j["old_id"] == 5);
        REQUIRE(j["new_id"] == 9);
    }

    SECTION("Opened position embeds the record") {
        Position position;
        position.id = 2;
        position.owner = BOB;
        position.side = Side::Short;
        position.open_price = units(100);
        position.liquidation_price = units(108);
        position.liquidation_id = 6;
        json j = to_json(LedgerEvent{2, PositionOpened{position, 11, units(10)}});

        REQUIRE(j["event"] == "position_opened");
        REQUIRE(j["side"] == "short");
        REQUIRE(j["liquidation_price"] == "108");
        REQUIRE(j["liquidation_id"] == 6);
        REQUIRE(j["order_id"] == 11);
        REQUIRE(j["commission_accrued"] == "10");
    }
}

TEST_CASE("Event names", "[events]") {
    REQUIRE(std::string(event_name(OrderCreated{})) == "order_created");
    REQUIRE(std::string(event_name(PoolFunded{ALICE, 1, 1})) == "pool_funded");
    REQUIRE(std::string(event_name(CommissionWithdrawn{RECEIVER, 1})) == "commission_withdrawn");
}

TEST_CASE("Event log filters by type", "[events]") {
    EventLog log;
    log.on_event(LedgerEvent{1, PoolFunded{FUNDER, units(5), units(5)}});
    log.on_event(LedgerEvent{2, CommissionWithdrawn{RECEIVER, units(1)}});
    log.on_event(LedgerEvent{3, PoolFunded{FUNDER, units(2), units(7)}});

    auto funded = log.of_type<PoolFunded>();
    REQUIRE(funded.size() == 2);
    REQUIRE(funded[1].pool_balance == units(7));
    REQUIRE(log.size() == 3);

    log.clear();
    REQUIRE(log.size() == 0);
}

TEST_CASE("JSON lines writer", "[events]") {
    std::ostringstream out;
    JsonLinesWriter writer{out};

    writer.on_event(LedgerEvent{1, PoolFunded{FUNDER, units(5), units(5)}});
    writer.on_event(LedgerEvent{2, PoolWithdrawn{FUNDER, units(2), units(3)}});

    std::istringstream in{out.str()};
    std::string first;
    std::string second;
    REQUIRE(static_cast<bool>(std::getline(in, first)));
    REQUIRE(static_cast<bool>(std::getline(in, second)));
    REQUIRE(json::parse(first)["event"] == "pool_funded");
    REQUIRE(json::parse(second)["pool_balance"] == "3");
}

TEST_CASE("Ledger audit log file", "[events]") {
    std::string path = "perp_ledger_audit_test.jsonl";
    std::remove(path.c_str());

    {
        TestToken token;
        token.mint(ALICE, units(2000));
        RoleAccessPolicy access{std::vector<Address>{EXECUTOR}};
        Ledger ledger{test_config().with_audit_log(path), token, access, [] { return uint64_t{50}; }};

        OrderId id = ledger.create_order(limit_short());
        ledger.cancel_order(id, ALICE);
    }

    std::ifstream file{path};
    std::string line;
    std::vector<json> lines;
    while (std::getline(file, line)) {
        lines.push_back(json::parse(line));
    }
    file.close();
    std::remove(path.c_str());

    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0]["event"] == "order_created");
    REQUIRE(lines[0]["created_at"] == 50);
    REQUIRE(lines[1]["event"] == "order_cancelled");
    REQUIRE(lines[1]["refund"] == "1010");
}
