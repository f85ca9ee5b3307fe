// Perp Ledger - Logging Implementation

#include <perp/ledger/log.hpp>
#include <perp/ledger/errors.hpp>
#include <spdlog/sinks/stdout_sinks.h>
#include <mutex>

namespace perp::ledger {

namespace {

constexpr const char* LOG_PATTERN = "%Y-%m-%dT%H:%M:%S.%eZ %-7l [%n] %v";

std::mutex& registry_mutex() {
    static std::mutex mutex;
    return mutex;
}

spdlog::sink_ptr shared_sink() {
    static spdlog::sink_ptr sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    return sink;
}

}  // namespace

spdlog::level::level_enum parse_log_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    throw ConfigError("Unknown log level: " + std::string(name));
}

std::shared_ptr<spdlog::logger> component_logger(const std::string& component) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    if (auto existing = spdlog::get(component)) {
        return existing;
    }

    auto logger = std::make_shared<spdlog::logger>(component, shared_sink());
    spdlog::initialize_logger(logger);
    logger->set_pattern(LOG_PATTERN, spdlog::pattern_time_type::utc);
    return logger;
}

} // namespace perp::ledger
