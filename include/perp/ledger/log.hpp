// Perp Ledger - Logging
// Named spdlog loggers per component, sharing one stderr sink

#ifndef PERP_LEDGER_LOG_HPP
#define PERP_LEDGER_LOG_HPP

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>

namespace perp::ledger {

// "trace", "debug", "info", "warn", "error", "off"; throws ConfigError otherwise
spdlog::level::level_enum parse_log_level(std::string_view name);

// Returns the registered logger for a component ("custody", "orders", ...),
// creating it on first use. New loggers pick up the global spdlog level.
std::shared_ptr<spdlog::logger> component_logger(const std::string& component);

} // namespace perp::ledger

#endif // PERP_LEDGER_LOG_HPP
