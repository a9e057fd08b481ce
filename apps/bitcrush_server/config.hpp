/**
 * @file config.hpp
 * @brief Configuration management for the bitcrush server
 *
 * Provides configuration structures and command line parsing for the
 * bitcrush_server executable.
 */

#ifndef BITCRUSH_APP_SERVER_CONFIG_HPP
#define BITCRUSH_APP_SERVER_CONFIG_HPP

#include "bitcrush/integration/logger_adapter.hpp"
#include "bitcrush/integration/thread_adapter.hpp"
#include "bitcrush/web/rest_config.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace bitcrush::app {

/// Environment variable holding the default log level
inline constexpr const char* kLogLevelEnv = "BITCRUSH_LOG";

/**
 * @brief HTTP listener configuration
 */
struct network_config {
    /// Address to bind to
    std::string bind_address{"0.0.0.0"};

    /// Port to listen on
    std::uint16_t port{3000};

    /// HTTP worker threads
    std::size_t threads{4};

    /// Largest accepted upload in bytes
    std::size_t max_body_size{10 * 1024 * 1024};
};

/**
 * @brief Transform pool configuration
 */
struct transform_config {
    /// Worker threads running decode, transform and encode
    std::size_t workers{2};
};

/**
 * @brief Logging configuration
 */
struct logging_config {
    /// Minimum level
    integration::log_level level{integration::log_level::info};

    /// Directory for rotating log files (empty for console only)
    std::filesystem::path directory;
};

/**
 * @brief Complete bitcrush server configuration
 */
struct server_config {
    network_config network;

    transform_config transform;

    /// Directory holding the page templates
    std::filesystem::path templates{"./templates"};

    logging_config logging;

    /**
     * @brief Defaults, with the log level taken from BITCRUSH_LOG if set
     *
     * An unrecognized BITCRUSH_LOG value is reported on stderr and ignored.
     */
    static auto from_environment() -> server_config;

    /**
     * @brief Parse configuration from command line arguments
     *
     * Supported options:
     *   --bind <addr>             Address to bind (default: 0.0.0.0)
     *   --port <port>             Port to listen on (default: 3000)
     *   --threads <n>             HTTP worker threads (default: 4)
     *   --workers <n>             Transform workers (default: 2)
     *   --templates <dir>         Template directory (default: ./templates)
     *   --log-level <level>       Log level (default: info or $BITCRUSH_LOG)
     *   --log-dir <dir>           Also write rotating log files to dir
     *   --max-body-size <bytes>   Largest upload (default: 10485760)
     *   --help                    Show help message
     *
     * @param argc Argument count
     * @param argv Argument vector
     * @return Configuration or nullopt if --help was requested or error
     */
    static auto parse_args(int argc, char* argv[]) -> std::optional<server_config>;

    /**
     * @brief Print help message to stdout
     */
    static void print_help();

    /// HTTP server settings derived from this configuration
    [[nodiscard]] auto to_rest_config() const -> web::rest_server_config;

    /// Logger settings derived from this configuration
    [[nodiscard]] auto to_logger_config() const -> integration::logger_config;

    /// Transform pool settings derived from this configuration
    [[nodiscard]] auto to_pool_config() const -> integration::thread_pool_config;
};

}  // namespace bitcrush::app

#endif  // BITCRUSH_APP_SERVER_CONFIG_HPP
