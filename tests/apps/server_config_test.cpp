/**
 * @file server_config_test.cpp
 * @brief Unit tests for bitcrush_server command line parsing
 */

#include "config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <initializer_list>
#include <string>
#include <vector>

using namespace bitcrush::app;
using bitcrush::integration::log_level;

namespace {

/**
 * @brief Owns a mutable argv built from string literals
 */
class argv_builder {
public:
    argv_builder(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "bitcrush_server");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    [[nodiscard]] int argc() const { return static_cast<int>(storage_.size()); }
    [[nodiscard]] char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

auto parse(std::initializer_list<std::string> args) -> std::optional<server_config> {
    argv_builder builder(args);
    return server_config::parse_args(builder.argc(), builder.argv());
}

/**
 * @brief Clears BITCRUSH_LOG for the lifetime of a test
 */
struct log_env_guard {
    log_env_guard() { ::unsetenv(kLogLevelEnv); }
    ~log_env_guard() { ::unsetenv(kLogLevelEnv); }
};

}  // namespace

TEST_CASE("server_config defaults", "[app][config]") {
    log_env_guard guard;
    auto config = parse({});

    REQUIRE(config.has_value());
    REQUIRE(config->network.bind_address == "0.0.0.0");
    REQUIRE(config->network.port == 3000);
    REQUIRE(config->network.threads == 4);
    REQUIRE(config->network.max_body_size == 10 * 1024 * 1024);
    REQUIRE(config->transform.workers == 2);
    REQUIRE(config->templates == "./templates");
    REQUIRE(config->logging.level == log_level::info);
    REQUIRE(config->logging.directory.empty());
}

TEST_CASE("server_config parses options", "[app][config]") {
    log_env_guard guard;

    auto config = parse({"--bind", "127.0.0.1", "--port", "8081", "--threads", "8",
                         "--workers", "3", "--templates", "/srv/templates",
                         "--log-level", "debug", "--log-dir", "/tmp/bitcrush",
                         "--max-body-size", "2048"});

    REQUIRE(config.has_value());
    REQUIRE(config->network.bind_address == "127.0.0.1");
    REQUIRE(config->network.port == 8081);
    REQUIRE(config->network.threads == 8);
    REQUIRE(config->transform.workers == 3);
    REQUIRE(config->templates == "/srv/templates");
    REQUIRE(config->logging.level == log_level::debug);
    REQUIRE(config->logging.directory == "/tmp/bitcrush");
    REQUIRE(config->network.max_body_size == 2048);
}

TEST_CASE("server_config rejects bad input", "[app][config]") {
    log_env_guard guard;

    SECTION("help") {
        REQUIRE_FALSE(parse({"--help"}).has_value());
        REQUIRE_FALSE(parse({"-h"}).has_value());
    }

    SECTION("unknown argument") {
        REQUIRE_FALSE(parse({"--frobnicate", "1"}).has_value());
        REQUIRE_FALSE(parse({"stray"}).has_value());
    }

    SECTION("missing value") {
        REQUIRE_FALSE(parse({"--port"}).has_value());
    }

    SECTION("port out of range") {
        REQUIRE_FALSE(parse({"--port", "0"}).has_value());
        REQUIRE_FALSE(parse({"--port", "65536"}).has_value());
        REQUIRE_FALSE(parse({"--port", "-1"}).has_value());
        REQUIRE_FALSE(parse({"--port", "80abc"}).has_value());
    }

    SECTION("worker counts") {
        REQUIRE_FALSE(parse({"--workers", "0"}).has_value());
        REQUIRE_FALSE(parse({"--threads", "5000"}).has_value());
    }

    SECTION("log level") {
        REQUIRE_FALSE(parse({"--log-level", "loud"}).has_value());
    }

    SECTION("empty bind address") {
        REQUIRE_FALSE(parse({"--bind", ""}).has_value());
    }
}

TEST_CASE("server_config reads the log level from the environment", "[app][config]") {
    log_env_guard guard;

    SECTION("valid value") {
        ::setenv(kLogLevelEnv, "warn", 1);
        REQUIRE(server_config::from_environment().logging.level == log_level::warn);
    }

    SECTION("command line wins") {
        ::setenv(kLogLevelEnv, "error", 1);
        auto config = parse({"--log-level", "trace"});
        REQUIRE(config.has_value());
        REQUIRE(config->logging.level == log_level::trace);
    }

    SECTION("invalid value is ignored") {
        ::setenv(kLogLevelEnv, "chatty", 1);
        REQUIRE(server_config::from_environment().logging.level == log_level::info);
    }
}

TEST_CASE("server_config derived settings", "[app][config]") {
    log_env_guard guard;
    auto config = parse({"--port", "4000", "--threads", "2", "--workers", "6",
                         "--max-body-size", "100"});
    REQUIRE(config.has_value());

    SECTION("rest config") {
        auto rest = config->to_rest_config();
        REQUIRE(rest.port == 4000);
        REQUIRE(rest.concurrency == 2);
        REQUIRE(rest.max_body_size == 100);
    }

    SECTION("pool config") {
        REQUIRE(config->to_pool_config().worker_count == 6);
    }

    SECTION("logger config is console only without a directory") {
        auto logger = config->to_logger_config();
        REQUIRE(logger.enable_console);
        REQUIRE_FALSE(logger.enable_file);
    }

    SECTION("logger config writes files with a directory") {
        config->logging.directory = "/var/log/bitcrush";
        auto logger = config->to_logger_config();
        REQUIRE(logger.enable_file);
        REQUIRE(logger.log_directory == "/var/log/bitcrush");
    }
}
