// mcpack_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <mcpack/core/log.hpp>

#include "test_support.hpp"

using namespace mcpack_core;

TEST_CASE("Log level names", "[core][log]") {
    SECTION("parse") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("error") == spdlog::level::err);
        REQUIRE_FALSE(parse_log_level("loud").has_value());
    }

    SECTION("name round trip") {
        for (auto level : {spdlog::level::debug, spdlog::level::info, spdlog::level::err}) {
            REQUIRE(parse_log_level(log_level_name(level)) == level);
        }
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name returns same logger") {
        auto a = get_logger("mcpack_test_logger");
        auto b = get_logger("mcpack_test_logger");
        REQUIRE(a == b);
        REQUIRE(a->name() == "mcpack_test_logger");
    }

    SECTION("module loggers") {
        REQUIRE(convert_logger()->name() == "mcpack_convert");
        REQUIRE(archive_logger()->name() == "mcpack_archive");
    }

    SECTION("global level applies to existing loggers") {
        auto previous = get_global_log_level();
        auto logger = get_logger("mcpack_test_level");

        set_global_log_level(spdlog::level::warn);
        REQUIRE(logger->level() == spdlog::level::warn);
        REQUIRE(get_global_log_level() == spdlog::level::warn);

        set_global_log_level(previous);
    }
}

TEST_CASE("Log scope", "[core][log]") {
    LogScope scope("test scope", get_logger("mcpack_test_logger"));
    REQUIRE(scope.elapsed_ms() >= 0);
}

TEST_CASE("Log file configuration", "[core][log]") {
    mcpack_test::TempDir dir;
    auto previous = get_global_log_level();

    SECTION("messages reach the log file") {
        LogConfig config;
        config.console_enabled = false;
        config.level = spdlog::level::debug;
        config.log_file = dir / "logs/run.log";
        REQUIRE(configure_logging(config));

        get_logger("mcpack_test_file")->info("staged {} files", 3);
        MCPACK_LOG_INFO("default logger shares the file");
        flush_all_loggers();

        auto content = mcpack_test::read_file(config.log_file);
        REQUIRE(content.find("staged 3 files") != std::string::npos);
        REQUIRE(content.find("[mcpack_test_file]") != std::string::npos);
        REQUIRE(content.find("default logger shares the file") != std::string::npos);
    }

    SECTION("unopenable log file") {
        mcpack_test::write_file(dir / "blocker", "not a directory");

        LogConfig config;
        config.console_enabled = false;
        config.log_file = dir / "blocker/run.log";
        auto result = configure_logging(config);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::IOError);
    }

    // Back to console only so the temp directory can be removed
    LogConfig restore;
    restore.level = previous;
    REQUIRE(configure_logging(restore));
}
