/**
 * @file rest_server.hpp
 * @brief HTTP server for the bitcrush service
 *
 * This file provides the rest_server class which serves image uploads,
 * image downloads, the upload page and the system API using the Crow
 * framework.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "rest_config.hpp"

#include <cstdint>
#include <memory>

namespace bitcrush::services {
class image_service;
} // namespace bitcrush::services

namespace bitcrush::web {

class template_registry;

/**
 * @class rest_server
 * @brief HTTP server built on Crow
 *
 * The server is configured with collaborators before start(). Routes
 * whose collaborator is missing answer 503 (images) or 500 (pages).
 *
 * @example
 * @code
 * rest_server_config config;
 * config.port = 3000;
 *
 * rest_server server(config);
 * server.set_image_service(service);
 * server.set_template_registry(templates);
 * server.start_async();
 * // ...
 * server.stop();
 * @endcode
 */
class rest_server {
public:
  /**
   * @brief Construct server with default configuration
   */
  rest_server();

  /**
   * @brief Construct server with configuration
   * @param config Server configuration
   */
  explicit rest_server(const rest_server_config &config);

  /**
   * @brief Destructor - stops server if running
   */
  ~rest_server();

  /// Non-copyable
  rest_server(const rest_server &) = delete;
  rest_server &operator=(const rest_server &) = delete;

  /// Movable
  rest_server(rest_server &&other) noexcept;
  rest_server &operator=(rest_server &&other) noexcept;

  // =========================================================================
  // Configuration
  // =========================================================================

  [[nodiscard]] const rest_server_config &config() const noexcept;

  /**
   * @brief Update configuration
   * @note Takes effect on the next start
   */
  void set_config(const rest_server_config &config);

  // =========================================================================
  // Integration
  // =========================================================================

  /**
   * @brief Set the service behind /upload and /images
   */
  void set_image_service(std::shared_ptr<services::image_service> service);

  /**
   * @brief Set the templates behind /, /style.css and /main.js
   */
  void set_template_registry(std::shared_ptr<template_registry> templates);

  // =========================================================================
  // Lifecycle
  // =========================================================================

  /**
   * @brief Run the server on the calling thread until stop()
   */
  void start();

  /**
   * @brief Run the server on a background thread
   */
  void start_async();

  /**
   * @brief Stop the server and join the background thread
   */
  void stop();

  [[nodiscard]] bool is_running() const noexcept;

  /**
   * @brief Block until the background server thread exits
   */
  void wait();

  /**
   * @brief Configured port while running, 0 otherwise
   */
  [[nodiscard]] std::uint16_t port() const noexcept;

private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

} // namespace bitcrush::web
