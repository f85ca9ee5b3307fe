// Perp Ledger - Basic Example
// Walks an order through execution, exit-trigger updates and settlement

#include <perp/ledger/ledger.hpp>
#include <perp/ledger/errors.hpp>
#include <iostream>

using namespace perp::ledger;

namespace {

void print_audit(const Ledger& ledger) {
    AuditSnapshot audit = ledger.audit();
    std::cout << "  custody " << x18::to_string(audit.custodied)
              << " = orders " << x18::to_string(audit.order_locked)
              << " + margin " << x18::to_string(audit.position_margin)
              << " + commission " << x18::to_string(audit.accrued)
              << " + pool " << x18::to_string(audit.pool)
              << (audit.balanced() ? "  [balanced]" : "  [IMBALANCED]") << "\n";
}

}  // namespace

int main() {
    const Address executor = address::from_index(1);
    const Address receiver = address::from_index(2);
    const Address trader = address::from_index(3);
    const Address funder = address::from_index(4);

    // Build configuration
    LedgerConfig config = LedgerConfig()
        .with_executor(executor)
        .with_commission_receiver(receiver)
        .with_log_level("warn");

    InMemoryToken token;
    token.mint(trader, x18::from_int(5000));
    token.mint(funder, x18::from_int(1000));

    RoleAccessPolicy access(config.roles.executors);
    JsonLinesWriter events(std::cout);

    try {
        Ledger ledger(config, token, access);
        ledger.add_listener(&events);

        std::cout << "Funding the pnl pool...\n";
        ledger.fund_pool(funder, x18::from_int(500));

        // Market long: margin 1000, commission 10, 10x leverage
        std::cout << "\nCreating market order...\n";
        OrderRequest request;
        request.owner = trader;
        request.asset = 1;
        request.side = Side::Long;
        request.margin = x18::from_int(1000);
        request.commission = x18::from_int(10);
        request.size = x18::from_int(100);
        request.leverage = 10;
        request.stop_loss = x18::from_int(94);
        OrderId order_id = ledger.create_order(request);
        print_audit(ledger);

        std::cout << "\nExecuting at 100...\n";
        PositionId position_id = ledger.execute_order(order_id, x18::from_int(100), ledger.order(order_id).created_at,
                                                      executor);
        Position position = ledger.position(position_id);
        std::cout << "  liquidation price " << x18::to_string(position.liquidation_price) << "\n";
        print_audit(ledger);

        std::cout << "\nMoving stop-loss twice...\n";
        TriggerId original = position.stop_loss_id;
        ledger.set_stop_loss(position_id, x18::from_int(95), trader);
        ledger.set_stop_loss(position_id, x18::from_int(96), trader);
        try {
            (void)ledger.trigger(original);
        } catch (const LedgerError& e) {
            std::cout << "  original trigger " << original << ": " << to_string(e.code()) << "\n";
        }

        std::cout << "\nClosing with a loss of 150...\n";
        CloseResult result = ledger.close_position(position_id, x18::from_int(-150), 0, executor);
        std::cout << "  payout " << x18::to_string(result.payout)
                  << ", pool " << x18::to_string(ledger.pool_balance()) << "\n";
        print_audit(ledger);

        std::cout << "\nWithdrawing commission...\n";
        I128 earned = ledger.withdraw_commission(receiver);
        std::cout << "  receiver got " << x18::to_string(earned) << "\n";
        print_audit(ledger);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
