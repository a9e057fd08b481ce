/**
 * @file system_endpoints.hpp
 * @brief System API endpoints for REST server
 *
 * This file provides the shared endpoint context and the system endpoints
 * for service status and configuration.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <chrono>
#include <memory>

namespace bitcrush::services {
class image_service;
} // namespace bitcrush::services

namespace bitcrush::web {

struct rest_server_config;
class template_registry;

/**
 * @struct rest_server_context
 * @brief Shared context for REST endpoints
 */
struct rest_server_context {
  /// Current server configuration (read-only)
  const rest_server_config *config{nullptr};

  /// Submission and retrieval of images
  std::shared_ptr<services::image_service> images;

  /// Compiled page templates
  std::shared_ptr<template_registry> templates;

  /// Time the context was created, reported as uptime
  std::chrono::steady_clock::time_point started{std::chrono::steady_clock::now()};
};

namespace endpoints {

// Internal function - implementation in cpp file
// Registers system endpoints with the Crow app
// Called from rest_server.cpp

} // namespace endpoints

} // namespace bitcrush::web
