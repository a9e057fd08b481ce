/**
 * @file config.cpp
 * @brief Configuration management implementation for the bitcrush server
 */

#include "config.hpp"

#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace bitcrush::app {

namespace {

/// Parse a positive integer no larger than max
std::optional<std::uint64_t> parse_count(std::string_view text, std::uint64_t max) {
    if (text.empty() || text.front() == '-') {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        auto value = std::stoull(std::string(text), &consumed);
        if (consumed != text.size() || value == 0 || value > max) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

void server_config::print_help() {
    std::cout << R"(
bitcrush - lossy image degradation service

Usage: bitcrush_server [OPTIONS]

Options:
  --bind <addr>            Address to bind (default: 0.0.0.0)
  --port <port>            Port to listen on (default: 3000)
  --threads <n>            HTTP worker threads (default: 4)
  --workers <n>            Transform worker threads (default: 2)
  --templates <dir>        Page template directory (default: ./templates)
  --log-level <level>      Log level: trace, debug, info, warn, error, fatal, off
                           (default: info, or $BITCRUSH_LOG)
  --log-dir <dir>          Also write rotating log files to this directory
  --max-body-size <bytes>  Largest accepted upload (default: 10485760)
  --help, -h               Show this help message

Endpoints:
  GET  /                   Upload page
  POST /upload             Raw JPEG/PNG body, answers {"src":"/images/<id>.jpg"}
  GET  /images/<id>.jpg    Degraded image
  GET  /api/v1/system/status

Examples:
  # Start with default settings
  bitcrush_server

  # Local only, more transform workers, verbose logging
  bitcrush_server --bind 127.0.0.1 --workers 8 --log-level debug

)";
}

auto server_config::from_environment() -> server_config {
    server_config config;

    if (const char* env = std::getenv(kLogLevelEnv); env != nullptr && *env != '\0') {
        auto level = integration::parse_log_level(env);
        if (level) {
            config.logging.level = *level;
        } else {
            std::cerr << "Warning: ignoring invalid " << kLogLevelEnv << " value: "
                      << env << "\n";
        }
    }

    return config;
}

auto server_config::parse_args(int argc, char* argv[]) -> std::optional<server_config> {
    server_config config = from_environment();

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        }

        // Every remaining option takes exactly one value
        if (i + 1 >= argc) {
            if (arg.substr(0, 2) == "--") {
                std::cerr << "Error: " << arg << " requires a value\n";
            } else {
                std::cerr << "Error: Unknown argument: " << arg << "\n";
            }
            return std::nullopt;
        }

        if (arg == "--bind") {
            config.network.bind_address = argv[++i];
            if (config.network.bind_address.empty()) {
                std::cerr << "Error: --bind requires a non-empty address\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--port") {
            auto port = parse_count(argv[++i], std::numeric_limits<std::uint16_t>::max());
            if (!port) {
                std::cerr << "Error: Invalid port number\n";
                return std::nullopt;
            }
            config.network.port = static_cast<std::uint16_t>(*port);
            continue;
        }

        if (arg == "--threads") {
            auto threads = parse_count(argv[++i], 1024);
            if (!threads) {
                std::cerr << "Error: --threads must be between 1 and 1024\n";
                return std::nullopt;
            }
            config.network.threads = static_cast<std::size_t>(*threads);
            continue;
        }

        if (arg == "--workers") {
            auto workers = parse_count(argv[++i], 1024);
            if (!workers) {
                std::cerr << "Error: --workers must be between 1 and 1024\n";
                return std::nullopt;
            }
            config.transform.workers = static_cast<std::size_t>(*workers);
            continue;
        }

        if (arg == "--templates") {
            config.templates = argv[++i];
            continue;
        }

        if (arg == "--log-level") {
            const std::string_view value = argv[++i];
            auto level = integration::parse_log_level(value);
            if (!level) {
                std::cerr << "Error: Invalid log level: " << value << "\n";
                std::cerr << "Valid levels: trace, debug, info, warn, error, fatal, off\n";
                return std::nullopt;
            }
            config.logging.level = *level;
            continue;
        }

        if (arg == "--log-dir") {
            config.logging.directory = argv[++i];
            continue;
        }

        if (arg == "--max-body-size") {
            auto size = parse_count(argv[++i], std::numeric_limits<std::size_t>::max());
            if (!size) {
                std::cerr << "Error: Invalid --max-body-size\n";
                return std::nullopt;
            }
            config.network.max_body_size = static_cast<std::size_t>(*size);
            continue;
        }

        std::cerr << "Error: Unknown argument: " << arg << "\n";
        std::cerr << "Use --help for usage information\n";
        return std::nullopt;
    }

    return config;
}

auto server_config::to_rest_config() const -> web::rest_server_config {
    web::rest_server_config rest;
    rest.bind_address = network.bind_address;
    rest.port = network.port;
    rest.concurrency = network.threads;
    rest.max_body_size = network.max_body_size;
    return rest;
}

auto server_config::to_logger_config() const -> integration::logger_config {
    integration::logger_config logger;
    logger.min_level = logging.level;
    logger.enable_console = true;
    logger.enable_file = !logging.directory.empty();
    if (logger.enable_file) {
        logger.log_directory = logging.directory;
    }
    return logger;
}

auto server_config::to_pool_config() const -> integration::thread_pool_config {
    integration::thread_pool_config pool;
    pool.worker_count = transform.workers;
    return pool;
}

}  // namespace bitcrush::app
