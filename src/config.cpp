// Perp Ledger - Configuration Implementation

#include <perp/ledger/config.hpp>
#include <perp/ledger/errors.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace perp::ledger {

// Simple TOML parser (handles basic cases)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Accepts ["a", "b"] or a bare comma separated list
std::vector<std::string> split_list(std::string value) {
    if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
        value = value.substr(1, value.size() - 2);
    }

    std::vector<std::string> items;
    std::istringstream stream{value};
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = unquote(trim(item));
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

Address parse_address(const std::string& key, const std::string& value) {
    try {
        return address::from_hex(value);
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Invalid address for " + key + ": " + e.what());
    }
}

I128 parse_decimal(const std::string& key, const std::string& value) {
    try {
        return x18::from_string(value);
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Invalid decimal for " + key + ": " + e.what());
    }
}

}  // namespace

LedgerConfig LedgerConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

LedgerConfig LedgerConfig::from_toml(std::string_view content) {
    LedgerConfig config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Unterminated section header: " + line);
            }
            current_section = trim(line.substr(1, end - 1));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Expected key = value: " + line);
        }

        std::string key = trim(line.substr(0, eq));
        std::string raw = trim(line.substr(eq + 1));
        std::string value = unquote(raw);

        if (current_section == "general") {
            if (key == "log_level") config.general.log_level = value;
            else if (key == "audit_log") config.general.audit_log = value;
        }
        else if (current_section == "roles") {
            if (key == "executor" || key == "executors") {
                for (const auto& item : split_list(raw)) {
                    config.roles.executors.push_back(parse_address(key, item));
                }
            }
            else if (key == "commission_receiver") {
                config.roles.commission_receiver = parse_address(key, value);
            }
        }
        else if (current_section == "risk") {
            if (key == "liquidation_threshold") {
                config.risk.liquidation_threshold = parse_decimal(key, value);
            }
            else if (key == "min_liquidation_price") {
                config.risk.min_liquidation_price = parse_decimal(key, value);
            }
        }
    }

    return config;
}

void LedgerConfig::validate() const {
    if (address::is_zero(roles.commission_receiver)) {
        throw ConfigError("roles.commission_receiver must be set");
    }
    if (risk.liquidation_threshold <= 0 || risk.liquidation_threshold >= X18_ONE) {
        throw ConfigError("risk.liquidation_threshold must lie in (0, 1)");
    }
    if (risk.min_liquidation_price <= 0) {
        throw ConfigError("risk.min_liquidation_price must be positive");
    }
}

}  // namespace perp::ledger
