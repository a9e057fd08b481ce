/**
 * @file logger_adapter.hpp
 * @brief Adapter for structured logging through logger_system
 *
 * This file provides the logger_adapter class, the single logging entry
 * point of bitcrush. It forwards formatted messages to logger_system's
 * asynchronous logger and adds helpers for the service's recurring events
 * (submissions, lookups, failed requests).
 */

#pragma once

#include <bitcrush/compat/format.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace bitcrush::integration {

// ─────────────────────────────────────────────────────
// Log Level
// ─────────────────────────────────────────────────────

/**
 * @enum log_level
 * @brief Severity of a log message, in increasing order
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse a level name such as "debug" or "WARN"
 *
 * "warning" is accepted as an alias of warn.
 *
 * @return The level, or nullopt for an unknown name
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<log_level>;

/**
 * @brief Upper-case name of a level
 */
[[nodiscard]] auto to_string(log_level level) -> std::string;

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable rotating file output under log_directory
    bool enable_file{false};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{50};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Static logging facade over kcenon::logger::logger
 *
 * Messages logged before initialize() or after shutdown() are dropped.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.min_level = log_level::debug;
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Listening on {}:{}", address, port);
 * logger_adapter::log_submission(id, upload.size(), jpeg.size(), elapsed);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Create the logger and its writers
     *
     * A second call without shutdown() in between is ignored.
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and stop the logger
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(bitcrush::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::trace)) {
            log(log_level::trace, bitcrush::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void debug(bitcrush::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::debug)) {
            log(log_level::debug, bitcrush::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void info(bitcrush::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, bitcrush::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(bitcrush::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, bitcrush::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(bitcrush::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, bitcrush::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(bitcrush::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, bitcrush::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a preformatted message
     */
    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Service Events
    // ─────────────────────────────────────────────────────

    /**
     * @brief Log a stored submission at info level
     *
     * @param id Identifier of the new artifact
     * @param input_bytes Size of the upload
     * @param output_bytes Size of the stored JPEG
     * @param elapsed Time spent decoding, transforming and encoding
     */
    static void log_submission(const std::string& id,
                               std::size_t input_bytes,
                               std::size_t output_bytes,
                               std::chrono::milliseconds elapsed);

    /**
     * @brief Log an artifact lookup at debug level
     */
    static void log_retrieval(const std::string& id, bool found);

    /**
     * @brief Log a failed request with its internal detail at error level
     *
     * @param operation Name of the failing operation, e.g. "upload"
     * @param code Error code from bitcrush::error_codes
     * @param detail Internal message, never sent to the client
     */
    static void log_request_failure(std::string_view operation,
                                    int code,
                                    const std::string& detail);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> logger_config;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace bitcrush::integration
