// Perp Ledger - Replay Tool
//
// Applies a JSON-lines command script to a ledger backed by an in-memory
// token. Events and errors are written to stdout as JSON lines, followed by
// a final audit line. Exits nonzero if any command failed.

#include <perp/ledger/errors.hpp>
#include <perp/ledger/ledger.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using json = nlohmann::json;
using namespace perp::ledger;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string script_path;  // empty = stdin
    bool verbose = false;
    bool quiet = false;
};

void print_usage(const char* prog) {
    std::cout << "Perp Ledger replay\n\n"
              << "Usage: " << prog << " [options] [script.jsonl]\n\n"
              << "Options:\n"
              << "  -c, --config <file>  Ledger config (TOML). Without one, executor is\n"
              << "                       address 1 and commission receiver address 2\n"
              << "  -v, --verbose        Print the result of every command\n"
              << "  -q, --quiet          Do not print events\n"
              << "  -h, --help           Show this help message\n\n"
              << "Script lines are JSON objects with an \"op\" field:\n"
              << "  mint                {to, amount}\n"
              << "  create_order        {owner, side, margin, commission, size, leverage,\n"
              << "                       target_price, stop_loss, take_profit, asset}\n"
              << "  cancel_order        {order_id, caller}\n"
              << "  execute_order       {order_id, price, opened_at, caller}\n"
              << "  set_stop_loss       {position_id, price, caller}\n"
              << "  set_take_profit     {position_id, price, caller}\n"
              << "  close_position      {position_id, pnl, commission, caller}\n"
              << "  fund_pool           {from, amount}\n"
              << "  withdraw_pool       {to, amount, caller}\n"
              << "  withdraw_commission {caller}\n\n"
              << "Addresses are 0x-prefixed hex or small integers; amounts are integers\n"
              << "or decimal strings. An optional \"time\" field advances the clock.\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
        } else if (arg[0] != '-' && options.script_path.empty()) {
            options.script_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    return options;
}

//------------------------------------------------------------------------------
// Command decoding
//------------------------------------------------------------------------------

Address to_address(const json& value) {
    if (value.is_number_integer()) {
        auto index = value.get<int64_t>();
        if (index < 0 || index > 0xFFFF) {
            throw std::invalid_argument("address index out of range: " + value.dump());
        }
        return address::from_index(static_cast<uint16_t>(index));
    }
    return address::from_hex(value.get<std::string>());
}

I128 to_amount(const json& value) {
    if (value.is_number_integer()) {
        return x18::from_int(value.get<int64_t>());
    }
    if (value.is_string()) {
        return x18::from_string(value.get<std::string>());
    }
    throw std::invalid_argument("amount must be an integer or a decimal string: " + value.dump());
}

I128 amount_or(const json& cmd, const char* key, I128 fallback) {
    return cmd.contains(key) ? to_amount(cmd.at(key)) : fallback;
}

json audit_json(const Ledger& ledger) {
    AuditSnapshot audit = ledger.audit();
    LedgerStats stats = ledger.stats();
    return json{
        {"audit", {
            {"custodied", x18::to_string(audit.custodied)},
            {"order_locked", x18::to_string(audit.order_locked)},
            {"position_margin", x18::to_string(audit.position_margin)},
            {"accrued", x18::to_string(audit.accrued)},
            {"pool", x18::to_string(audit.pool)},
            {"balanced", audit.balanced()}
        }},
        {"stats", {
            {"live_orders", stats.live_orders},
            {"live_positions", stats.live_positions},
            {"live_triggers", stats.live_triggers},
            {"orders_created", stats.orders_created},
            {"positions_opened", stats.positions_opened},
            {"positions_closed", stats.positions_closed},
            {"events", stats.events_emitted},
            {"commission_accrued", x18::to_string(stats.commission_accrued)}
        }}
    };
}

//------------------------------------------------------------------------------
// Replay
//------------------------------------------------------------------------------

class Replay {
public:
    explicit Replay(LedgerConfig config)
        : access_(config.roles.executors)
        , ledger_(std::move(config), token_, access_, [this] { return now_; })
    {}

    Ledger& ledger() { return ledger_; }

    json apply(const json& cmd) {
        if (cmd.contains("time")) {
            now_ = cmd.at("time").get<uint64_t>();
        }

        const std::string op = cmd.at("op").get<std::string>();

        if (op == "mint") {
            token_.mint(to_address(cmd.at("to")), to_amount(cmd.at("amount")));
            return json::object();
        }
        if (op == "create_order") {
            OrderRequest request;
            request.owner = to_address(cmd.at("owner"));
            request.asset = cmd.value("asset", 0u);
            request.side = parse_side(cmd.value("side", "long"));
            request.target_price = amount_or(cmd, "target_price", 0);
            request.stop_loss = amount_or(cmd, "stop_loss", 0);
            request.take_profit = amount_or(cmd, "take_profit", 0);
            request.commission = amount_or(cmd, "commission", 0);
            request.margin = to_amount(cmd.at("margin"));
            request.size = to_amount(cmd.at("size"));
            request.leverage = cmd.value("leverage", 1u);
            return json{{"order_id", ledger_.create_order(request)}};
        }
        if (op == "cancel_order") {
            I128 refund = ledger_.cancel_order(cmd.at("order_id").get<OrderId>(), to_address(cmd.at("caller")));
            return json{{"refund", x18::to_string(refund)}};
        }
        if (op == "execute_order") {
            PositionId id = ledger_.execute_order(cmd.at("order_id").get<OrderId>(),
                                                  to_amount(cmd.at("price")),
                                                  cmd.value("opened_at", now_),
                                                  to_address(cmd.at("caller")));
            return json{{"position_id", id}};
        }
        if (op == "set_stop_loss" || op == "set_take_profit") {
            PositionId id = cmd.at("position_id").get<PositionId>();
            I128 price = to_amount(cmd.at("price"));
            Address caller = to_address(cmd.at("caller"));
            if (op == "set_stop_loss") {
                ledger_.set_stop_loss(id, price, caller);
            } else {
                ledger_.set_take_profit(id, price, caller);
            }
            return json::object();
        }
        if (op == "close_position") {
            CloseResult result = ledger_.close_position(cmd.at("position_id").get<PositionId>(),
                                                        to_amount(cmd.at("pnl")),
                                                        amount_or(cmd, "commission", 0),
                                                        to_address(cmd.at("caller")));
            return json{
                {"payout", x18::to_string(result.payout)},
                {"pool_delta", x18::to_string(result.pool_delta)},
                {"uncollected_loss", x18::to_string(result.uncollected_loss)}
            };
        }
        if (op == "fund_pool") {
            ledger_.fund_pool(to_address(cmd.at("from")), to_amount(cmd.at("amount")));
            return json::object();
        }
        if (op == "withdraw_pool") {
            ledger_.withdraw_pool(to_address(cmd.at("to")), to_amount(cmd.at("amount")),
                                  to_address(cmd.at("caller")));
            return json::object();
        }
        if (op == "withdraw_commission") {
            I128 amount = ledger_.withdraw_commission(to_address(cmd.at("caller")));
            return json{{"amount", x18::to_string(amount)}};
        }

        throw std::invalid_argument("unknown op: " + op);
    }

private:
    static Side parse_side(const std::string& side) {
        if (side == "long") return Side::Long;
        if (side == "short") return Side::Short;
        throw std::invalid_argument("side must be long or short: " + side);
    }

    InMemoryToken token_;
    RoleAccessPolicy access_;
    uint64_t now_ = 1;
    Ledger ledger_;
};

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

void report_error(size_t line_no, const std::string& op, const std::string& code, const std::string& message) {
    std::cout << json{
        {"error", code},
        {"line", line_no},
        {"op", op},
        {"message", message}
    }.dump() << "\n";
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    std::ifstream file;
    std::istream* in = &std::cin;
    if (!options.script_path.empty()) {
        file.open(options.script_path);
        if (!file.is_open()) {
            std::cerr << "Cannot open script: " << options.script_path << "\n";
            return 1;
        }
        in = &file;
    }

    JsonLinesWriter events(std::cout);
    std::unique_ptr<Replay> replay;
    try {
        LedgerConfig config;
        if (options.config_path.empty()) {
            config.with_executor(address::from_index(1))
                  .with_commission_receiver(address::from_index(2))
                  .with_log_level("warn");
        } else {
            config = LedgerConfig::from_file(options.config_path);
        }
        replay = std::make_unique<Replay>(std::move(config));
    } catch (const ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    if (!options.quiet) {
        replay->ledger().add_listener(&events);
    }

    size_t line_no = 0;
    size_t failures = 0;
    std::string line;
    while (std::getline(*in, line)) {
        ++line_no;
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;

        std::string op;
        try {
            json cmd = json::parse(line);
            op = cmd.value("op", "");
            json result = replay->apply(cmd);
            if (options.verbose) {
                std::cout << json{{"line", line_no}, {"op", op}, {"result", result}}.dump() << "\n";
            }
        } catch (const LedgerError& e) {
            report_error(line_no, op, to_string(e.code()), e.what());
            ++failures;
        } catch (const json::exception& e) {
            report_error(line_no, op, "invalid_command", e.what());
            ++failures;
        } catch (const std::invalid_argument& e) {
            report_error(line_no, op, "invalid_command", e.what());
            ++failures;
        }
    }

    json summary = audit_json(replay->ledger());
    summary["commands"] = line_no;
    summary["failures"] = failures;
    std::cout << summary.dump() << "\n";

    return failures == 0 ? 0 : 1;
}
