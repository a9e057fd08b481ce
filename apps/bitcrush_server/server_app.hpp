/**
 * @file server_app.hpp
 * @brief bitcrush server application class
 *
 * Provides the application class that wires the logger, the transform
 * pool, the artifact store, the image service, the page templates and the
 * HTTP server together.
 */

#ifndef BITCRUSH_APP_SERVER_APP_HPP
#define BITCRUSH_APP_SERVER_APP_HPP

#include "config.hpp"

#include "bitcrush/services/image_service.hpp"
#include "bitcrush/storage/artifact_store.hpp"
#include "bitcrush/web/rest_server.hpp"
#include "bitcrush/web/template_registry.hpp"

#include <atomic>
#include <chrono>
#include <memory>

namespace bitcrush::app {

/**
 * @brief Complete bitcrush server application
 *
 * ## Architecture
 *
 * ```
 * +-------------------------------------------+
 * |            bitcrush_server_app            |
 * +-------------------------------------------+
 * |  rest_server (Crow)                       |
 * |    |-- page endpoints --> template_registry|
 * |    |-- image endpoints --> image_service   |
 * |                              |            |
 * |             thread_adapter <-+-> store    |
 * +-------------------------------------------+
 * ```
 *
 * @example Usage
 * @code
 * bitcrush_server_app app{config};
 * if (!app.initialize() || !app.start()) {
 *     return 1;
 * }
 * app.wait_for_shutdown();
 * @endcode
 */
class bitcrush_server_app {
public:
    explicit bitcrush_server_app(const server_config& config);

    /**
     * @brief Destructor - stops everything still running
     */
    ~bitcrush_server_app();

    bitcrush_server_app(const bitcrush_server_app&) = delete;
    bitcrush_server_app& operator=(const bitcrush_server_app&) = delete;
    bitcrush_server_app(bitcrush_server_app&&) = delete;
    bitcrush_server_app& operator=(bitcrush_server_app&&) = delete;

    // =========================================================================
    // Lifecycle Management
    // =========================================================================

    /**
     * @brief Start logging and the transform pool, load templates, build
     *        the store, service and HTTP server
     *
     * @return true if initialization succeeded
     */
    [[nodiscard]] bool initialize();

    /**
     * @brief Start serving HTTP on a background thread
     *
     * @return true if server started successfully
     */
    [[nodiscard]] bool start();

    /**
     * @brief Stop the HTTP server, the transform pool and the logger, in
     *        that order
     */
    void stop();

    /**
     * @brief Block until request_shutdown() is called
     */
    void wait_for_shutdown();

    /**
     * @brief Ask wait_for_shutdown() to return
     *
     * Only stores an atomic flag, so it may be called from a signal handler.
     */
    void request_shutdown() noexcept;

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Print store and pool counters to stdout
     */
    void print_statistics() const;

private:
    [[nodiscard]] bool setup_logging();
    [[nodiscard]] bool setup_transform_pool();
    [[nodiscard]] bool setup_templates();
    [[nodiscard]] bool setup_service();
    [[nodiscard]] bool setup_server();

    server_config config_;

    std::shared_ptr<storage::artifact_store> store_;
    std::shared_ptr<services::image_service> service_;
    std::shared_ptr<web::template_registry> templates_;
    std::unique_ptr<web::rest_server> server_;

    std::chrono::steady_clock::time_point started_at_;
    bool initialized_{false};
    bool stopped_{false};

    std::atomic<bool> shutdown_requested_{false};
};

}  // namespace bitcrush::app

#endif  // BITCRUSH_APP_SERVER_APP_HPP
