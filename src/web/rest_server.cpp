/**
 * @file rest_server.cpp
 * @brief HTTP server implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any bitcrush headers to avoid forward
// declaration conflicts
#include "crow.h"

#include "bitcrush/integration/logger_adapter.hpp"
#include "bitcrush/web/endpoints/image_endpoints.hpp"
#include "bitcrush/web/endpoints/page_endpoints.hpp"
#include "bitcrush/web/endpoints/system_endpoints.hpp"
#include "bitcrush/web/rest_config.hpp"
#include "bitcrush/web/rest_server.hpp"
#include "bitcrush/web/rest_types.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>

namespace bitcrush::web {

// Forward declare internal registration functions
namespace endpoints {
void register_system_endpoints_impl(crow::SimpleApp &app,
                                    std::shared_ptr<rest_server_context> ctx);
void register_image_endpoints_impl(crow::SimpleApp &app,
                                   std::shared_ptr<rest_server_context> ctx);
void register_page_endpoints_impl(crow::SimpleApp &app,
                                  std::shared_ptr<rest_server_context> ctx);
} // namespace endpoints

/**
 * @brief Implementation details for rest_server
 */
struct rest_server::impl {
  rest_server_config config;
  std::shared_ptr<rest_server_context> context;
  std::unique_ptr<crow::SimpleApp> app;
  std::thread server_thread;
  std::atomic<bool> running{false};
  bool stop_requested{false};
  /// False from start until run() has returned
  bool finished{true};
  std::condition_variable finished_cv;
  std::mutex mutex;

  impl() : context(std::make_shared<rest_server_context>()) {
    context->config = &config;
  }

  explicit impl(const rest_server_config &cfg)
      : config(cfg), context(std::make_shared<rest_server_context>()) {
    context->config = &config;
  }

  /**
   * @brief Create the Crow app and register every route
   */
  crow::SimpleApp &build_app() {
    std::lock_guard<std::mutex> lock(mutex);

    app = std::make_unique<crow::SimpleApp>();
    app->loglevel(crow::LogLevel::Warning);

    endpoints::register_system_endpoints_impl(*app, context);
    endpoints::register_image_endpoints_impl(*app, context);
    endpoints::register_page_endpoints_impl(*app, context);

    // CORS preflight for the system API
    if (config.enable_cors) {
      CROW_ROUTE((*app), "/api/<path>")
          .methods(crow::HTTPMethod::OPTIONS)(
              [this](const crow::request & /*req*/,
                     const std::string & /*path*/) {
                crow::response res(204);
                res.add_header("Access-Control-Allow-Origin",
                               config.cors_allowed_origins);
                res.add_header("Access-Control-Allow-Methods",
                               "GET, POST, OPTIONS");
                res.add_header("Access-Control-Allow-Headers",
                               "Content-Type");
                res.add_header("Access-Control-Max-Age", "86400");
                return res;
              });
    }

    app->bindaddr(config.bind_address)
        .port(config.port)
        .concurrency(static_cast<std::uint16_t>(config.concurrency))
        .timeout(static_cast<std::uint8_t>(
            std::min<std::uint32_t>(config.request_timeout_seconds, 255)));
    return *app;
  }

  /**
   * @brief Reset the lifecycle flags before run() is entered
   */
  void prepare_run() {
    std::lock_guard<std::mutex> lock(mutex);
    stop_requested = false;
    finished = false;
  }

  void run() {
    run_app();
    {
      std::lock_guard<std::mutex> lock(mutex);
      finished = true;
      running = false;
    }
    finished_cv.notify_all();
  }

  void run_app() {
    auto &crow_app = build_app();
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (stop_requested) {
        return;
      }
    }

    integration::logger_adapter::info("Listening on {}:{} ({} HTTP workers)",
                                      config.bind_address, config.port,
                                      config.concurrency);
    try {
      crow_app.run();
    } catch (const std::exception &e) {
      integration::logger_adapter::error("HTTP server failed: {}", e.what());
    }
  }

  /**
   * @brief Stop Crow and wait for run() to return
   *
   * crow::App::stop() is a no-op until run() has created its server, so a
   * stop that lands between build_app() and the server start is repeated.
   */
  void request_stop() {
    std::unique_lock<std::mutex> lock(mutex);
    stop_requested = true;
    while (!finished) {
      if (app) {
        app->stop();
      }
      finished_cv.wait_for(lock, std::chrono::milliseconds(10));
    }
  }
};

rest_server::rest_server() : impl_(std::make_unique<impl>()) {}

rest_server::rest_server(const rest_server_config &config)
    : impl_(std::make_unique<impl>(config)) {}

rest_server::~rest_server() {
  if (impl_) {
    stop();
  }
}

rest_server::rest_server(rest_server &&other) noexcept = default;

rest_server &rest_server::operator=(rest_server &&other) noexcept {
  if (this != &other) {
    if (impl_) {
      stop();
    }
    impl_ = std::move(other.impl_);
  }
  return *this;
}

const rest_server_config &rest_server::config() const noexcept {
  return impl_->config;
}

void rest_server::set_config(const rest_server_config &config) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config = config;
  impl_->context->config = &impl_->config;
}

void rest_server::set_image_service(
    std::shared_ptr<services::image_service> service) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->context->images = std::move(service);
}

void rest_server::set_template_registry(
    std::shared_ptr<template_registry> templates) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->context->templates = std::move(templates);
}

void rest_server::start() {
  if (impl_->running.exchange(true)) {
    return; // Already running
  }

  impl_->prepare_run();
  impl_->run();
}

void rest_server::start_async() {
  if (impl_->running.exchange(true)) {
    return; // Already running
  }

  impl_->prepare_run();
  // The impl outlives moves of the owning rest_server
  impl_->server_thread = std::thread([impl = impl_.get()]() { impl->run(); });
}

void rest_server::stop() {
  if (!impl_->running && !impl_->server_thread.joinable()) {
    return;
  }

  impl_->request_stop();

  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }

  impl_->running = false;
}

bool rest_server::is_running() const noexcept { return impl_->running; }

void rest_server::wait() {
  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }
}

std::uint16_t rest_server::port() const noexcept {
  return impl_->running ? impl_->config.port : 0;
}

} // namespace bitcrush::web
