/**
 * @file server_app.cpp
 * @brief bitcrush server application implementation
 */

#include "server_app.hpp"

#include "bitcrush/core/random_source.hpp"
#include "bitcrush/integration/logger_adapter.hpp"
#include "bitcrush/integration/thread_adapter.hpp"

#include <iostream>
#include <thread>

namespace bitcrush::app {

using integration::logger_adapter;
using integration::thread_adapter;

// =============================================================================
// Construction / Destruction
// =============================================================================

bitcrush_server_app::bitcrush_server_app(const server_config& config)
    : config_(config) {}

bitcrush_server_app::~bitcrush_server_app() {
    stop();
}

// =============================================================================
// Lifecycle Management
// =============================================================================

bool bitcrush_server_app::initialize() {
    if (!setup_logging()) {
        return false;
    }

    logger_adapter::info("Initializing bitcrush server...");

    if (!setup_transform_pool()) {
        return false;
    }

    if (!setup_templates()) {
        return false;
    }

    if (!setup_service()) {
        return false;
    }

    if (!setup_server()) {
        return false;
    }

    initialized_ = true;
    logger_adapter::info("bitcrush server initialized");
    return true;
}

bool bitcrush_server_app::start() {
    if (!initialized_) {
        std::cerr << "Error: Server not initialized\n";
        return false;
    }

    started_at_ = std::chrono::steady_clock::now();
    server_->start_async();

    logger_adapter::info("Serving http://{}:{}/", config_.network.bind_address,
                         config_.network.port);
    logger_adapter::info("Press Ctrl+C to stop");
    return true;
}

void bitcrush_server_app::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;

    if (server_) {
        logger_adapter::info("Stopping HTTP server...");
        server_->stop();
    }

    logger_adapter::info("Stopping transform pool...");
    thread_adapter::shutdown(true);

    logger_adapter::info("bitcrush server stopped");
    logger_adapter::shutdown();
}

void bitcrush_server_app::wait_for_shutdown() {
    // Also returns if the HTTP server exits on its own, e.g. on a bind failure
    while (!shutdown_requested_.load() && is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

void bitcrush_server_app::request_shutdown() noexcept {
    shutdown_requested_ = true;
}

bool bitcrush_server_app::is_running() const noexcept {
    return server_ && server_->is_running();
}

void bitcrush_server_app::print_statistics() const {
    if (!store_) {
        return;
    }

    auto stats = store_->stats();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_);

    std::cout << "\n";
    std::cout << "=== bitcrush Statistics ===\n";
    std::cout << "Uptime: " << uptime.count() << " seconds\n";
    std::cout << "Images Stored: " << stats.artifact_count << "\n";
    std::cout << "Bytes Stored: " << stats.total_bytes << "\n";
    std::cout << "Lookups (hit/miss): " << stats.hits << "/" << stats.misses << "\n";
    std::cout << "===========================\n";
    std::cout << "\n";
}

// =============================================================================
// Private Setup Methods
// =============================================================================

bool bitcrush_server_app::setup_logging() {
    try {
        logger_adapter::initialize(config_.to_logger_config());
    } catch (const std::exception& e) {
        std::cerr << "Error: Failed to initialize logging: " << e.what() << "\n";
        return false;
    }
    logger_adapter::debug("Log level: {}", integration::to_string(config_.logging.level));
    return true;
}

bool bitcrush_server_app::setup_transform_pool() {
    thread_adapter::configure(config_.to_pool_config());
    if (!thread_adapter::start()) {
        logger_adapter::error("Failed to start transform pool");
        return false;
    }
    logger_adapter::info("Transform pool started with {} worker(s)",
                         thread_adapter::get_thread_count());
    return true;
}

bool bitcrush_server_app::setup_templates() {
    templates_ = std::make_shared<web::template_registry>();

    auto loaded = templates_->load_directory(config_.templates);
    if (loaded.is_err()) {
        logger_adapter::error("Failed to load templates from {}: {}",
                              config_.templates.string(), describe(loaded.error()));
        return false;
    }

    logger_adapter::info("Compiled {} template(s) from {}", templates_->size(),
                         config_.templates.string());
    return true;
}

bool bitcrush_server_app::setup_service() {
    store_ = std::make_shared<storage::artifact_store>();
    service_ = std::make_shared<services::image_service>(store_, make_default_random_source());
    return true;
}

bool bitcrush_server_app::setup_server() {
    server_ = std::make_unique<web::rest_server>(config_.to_rest_config());
    server_->set_image_service(service_);
    server_->set_template_registry(templates_);
    return true;
}

}  // namespace bitcrush::app
