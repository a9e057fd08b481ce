/**
 * @file rest_config.hpp
 * @brief Configuration for the HTTP server
 *
 * This file provides configuration options for the HTTP server including
 * bind address, port, concurrency, CORS, and upload limits.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace bitcrush::web {

/**
 * @struct rest_server_config
 * @brief Configuration options for the REST server
 */
struct rest_server_config {
  /// Address to bind the server to
  std::string bind_address{"0.0.0.0"};

  /// Port to listen on
  std::uint16_t port{3000};

  /// Number of worker threads for handling requests
  std::size_t concurrency{4};

  /// Enable CORS (Cross-Origin Resource Sharing) headers
  bool enable_cors{true};

  /// CORS allowed origins (empty = no header)
  std::string cors_allowed_origins{"*"};

  /// Request timeout in seconds
  std::uint32_t request_timeout_seconds{30};

  /// Maximum upload size in bytes (default 10MB)
  std::size_t max_body_size{10 * 1024 * 1024};
};

} // namespace bitcrush::web
