#include <catch2/catch_test_macros.hpp>
#include "Logger.hpp"
#include "TestHelpers.hpp"

TEST_CASE("parse_level understands spdlog names and falls back otherwise") {
    CHECK(Logger::parse_level("debug", spdlog::level::info) == spdlog::level::debug);
    CHECK(Logger::parse_level("WARNING", spdlog::level::info) == spdlog::level::warn);
    CHECK(Logger::parse_level("off", spdlog::level::info) == spdlog::level::off);
    CHECK(Logger::parse_level("", spdlog::level::err) == spdlog::level::err);
    CHECK(Logger::parse_level("chatty", spdlog::level::info) == spdlog::level::info);
}

TEST_CASE("setup_loggers registers the core and network loggers with a log file") {
    TempDir temp;
    const auto log_dir = temp.path() / "logs";

    Logger::setup_loggers(log_dir.string(), spdlog::level::off, spdlog::level::info);
    struct DropGuard {
        ~DropGuard() {
            spdlog::drop("core_logger");
            spdlog::drop("net_logger");
        }
    } guard;

    auto core = Logger::get_logger("core_logger");
    auto net = Logger::get_logger("net_logger");
    REQUIRE(core);
    REQUIRE(net);

    core->info("probe run started");
    core->flush();

    const auto log_file = log_dir / "key_probe.log";
    REQUIRE(std::filesystem::exists(log_file));
    CHECK(read_text_file(log_file).find("probe run started") != std::string::npos);
}
