// Perp Ledger - Logging Tests

#include "test_support.hpp"
#include <catch2/catch_test_macros.hpp>
#include <perp/ledger/log.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

using namespace perp::ledger;
using namespace perp::ledger::testing;

namespace {

// Captures one logger's output for the lifetime of the capture
class Capture {
public:
    explicit Capture(std::shared_ptr<spdlog::logger> logger)
        : logger_(std::move(logger))
        , sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(out_)) {
        sink_->set_pattern("%l [%n] %v");
        logger_->sinks().push_back(sink_);
    }

    ~Capture() {
        logger_->sinks().pop_back();
        spdlog::set_level(spdlog::level::off);
    }

    std::string text() const { return out_.str(); }

private:
    std::ostringstream out_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
};

}  // namespace

TEST_CASE("Component loggers are shared by name", "[log]") {
    auto logger = component_logger("test");
    REQUIRE(logger->name() == "test");
    REQUIRE(component_logger("test") == logger);
    REQUIRE(spdlog::get("test") == logger);
}

TEST_CASE("Component loggers filter by the global level", "[log]") {
    auto logger = component_logger("test");
    Capture capture(logger);
    spdlog::set_level(spdlog::level::info);

    logger->debug("hidden {}", 1);
    logger->info("shown {}", 2);
    logger->error("failed");

    std::string text = capture.text();
    REQUIRE(text.find("hidden") == std::string::npos);
    REQUIRE(text.find("info [test] shown 2") != std::string::npos);
    REQUIRE(text.find("error [test] failed") != std::string::npos);

    SECTION("New loggers start at the global level") {
        spdlog::set_level(spdlog::level::warn);
        auto fresh = component_logger("test_fresh");
        REQUIRE(fresh->level() == spdlog::level::warn);
        REQUIRE_FALSE(fresh->should_log(spdlog::level::info));
    }
}

TEST_CASE("Ledger applies its configured level and logs rejections", "[log]") {
    TestToken token;
    RoleAccessPolicy access{std::vector<Address>{EXECUTOR}};
    Ledger ledger{test_config().with_log_level("warn"), token, access, [] { return uint64_t{1000}; }};

    REQUIRE(component_logger("settlement")->level() == spdlog::level::warn);

    Capture capture(component_logger("ledger"));
    REQUIRE(code_of([&] { (void)ledger.create_order(market_long()); }) == ErrorCode::TransferFailed);

    REQUIRE(capture.text().find("warning [ledger] create_order rejected (transfer_failed)") != std::string::npos);
}
