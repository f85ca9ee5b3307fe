// Perp Ledger - Configuration
// Builder pattern for fluent configuration, or load from a TOML file

#ifndef PERP_LEDGER_CONFIG_HPP
#define PERP_LEDGER_CONFIG_HPP

#include <perp/ledger/types.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace perp::ledger {

// General settings
struct GeneralConfig {
    std::string log_level = "info";
    std::string audit_log;  // empty = no JSON-lines audit file
};

// Roles resolved by RoleAccessPolicy and the settlement engine
struct RolesConfig {
    std::vector<Address> executors;
    Address commission_receiver{};
};

// Liquidation parameters
struct RiskParams {
    // Fraction of initial margin that may be lost before liquidation (0.8 = 80%)
    I128 liquidation_threshold = 800000000000000000LL;
    // Long liquidation prices never drop below this
    I128 min_liquidation_price = 1;
};

class LedgerConfig {
public:
    GeneralConfig general;
    RolesConfig roles;
    RiskParams risk;

    LedgerConfig() = default;

    // Load from TOML file
    static LedgerConfig from_file(std::string_view path);

    // Load from TOML string
    static LedgerConfig from_toml(std::string_view content);

    // Throws ConfigError when the configuration cannot drive a ledger
    void validate() const;

    LedgerConfig& with_executor(const Address& executor) {
        roles.executors.push_back(executor);
        return *this;
    }

    LedgerConfig& with_commission_receiver(const Address& receiver) {
        roles.commission_receiver = receiver;
        return *this;
    }

    LedgerConfig& with_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    LedgerConfig& with_audit_log(std::string_view path) {
        general.audit_log = std::string(path);
        return *this;
    }

    LedgerConfig& set_liquidation_threshold(I128 threshold_x18) {
        risk.liquidation_threshold = threshold_x18;
        return *this;
    }

    LedgerConfig& set_min_liquidation_price(I128 price_x18) {
        risk.min_liquidation_price = price_x18;
        return *this;
    }
};

} // namespace perp::ledger

#endif // PERP_LEDGER_CONFIG_HPP
