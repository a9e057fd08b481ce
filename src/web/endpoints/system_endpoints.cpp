/**
 * @file system_endpoints.cpp
 * @brief System API endpoints implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any bitcrush headers to avoid forward
// declaration conflicts
#include "crow.h"

#include "bitcrush/integration/thread_adapter.hpp"
#include "bitcrush/services/image_service.hpp"
#include "bitcrush/web/endpoints/system_endpoints.hpp"
#include "bitcrush/web/rest_config.hpp"
#include "bitcrush/web/rest_types.hpp"

#include <sstream>

namespace bitcrush::web::endpoints {

namespace {

constexpr const char *kServiceVersion = "1.0.0";

/**
 * @brief Add CORS headers to response
 */
void add_cors_headers(crow::response &res, const rest_server_context &ctx) {
  if (ctx.config && ctx.config->enable_cors &&
      !ctx.config->cors_allowed_origins.empty()) {
    res.add_header("Access-Control-Allow-Origin",
                   ctx.config->cors_allowed_origins);
  }
}

/**
 * @brief Build config JSON from rest_server_config
 */
std::string config_to_json(const rest_server_config &config) {
  std::ostringstream oss;
  oss << R"({"bind_address":")" << json_escape(config.bind_address) << R"(",)"
      << R"("port":)" << config.port << R"(,)"
      << R"("concurrency":)" << config.concurrency << R"(,)"
      << R"("enable_cors":)" << (config.enable_cors ? "true" : "false")
      << R"(,)"
      << R"("cors_allowed_origins":")"
      << json_escape(config.cors_allowed_origins) << R"(",)"
      << R"("request_timeout_seconds":)" << config.request_timeout_seconds
      << R"(,)"
      << R"("max_body_size":)" << config.max_body_size << "}";
  return oss.str();
}

} // namespace

// Internal implementation function called from rest_server.cpp
void register_system_endpoints_impl(crow::SimpleApp &app,
                                    std::shared_ptr<rest_server_context> ctx) {
  // GET /api/v1/system/status - Service status and store statistics
  CROW_ROUTE(app, "/api/v1/system/status")
      .methods(crow::HTTPMethod::GET)([ctx]() {
        crow::response res;
        res.add_header("Content-Type", "application/json");
        add_cors_headers(res, *ctx);

        crow::json::wvalue status_json;
        status_json["version"] = kServiceVersion;
        status_json["uptime_seconds"] = static_cast<std::int64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - ctx->started)
                .count());

        if (ctx->images) {
          auto stats = ctx->images->store()->stats();
          status_json["status"] = "ok";
          status_json["store"]["artifacts"] =
              static_cast<std::uint64_t>(stats.artifact_count);
          status_json["store"]["bytes"] =
              static_cast<std::uint64_t>(stats.total_bytes);
          status_json["store"]["hits"] = stats.hits;
          status_json["store"]["misses"] = stats.misses;
        } else {
          status_json["status"] = "degraded";
          status_json["message"] = "Image service not configured";
        }

        auto pool = integration::thread_adapter::get_statistics();
        status_json["transform_pool"]["running"] = pool.running;
        status_json["transform_pool"]["threads"] =
            static_cast<std::uint64_t>(pool.thread_count);
        status_json["transform_pool"]["pending_jobs"] =
            static_cast<std::uint64_t>(pool.pending_jobs);
        status_json["transform_pool"]["idle_workers"] =
            static_cast<std::uint64_t>(pool.idle_workers);

        res.body = status_json.dump();
        res.code = 200;
        return res;
      });

  // GET /api/v1/system/config - Current configuration
  CROW_ROUTE(app, "/api/v1/system/config")
      .methods(crow::HTTPMethod::GET)([ctx]() {
        crow::response res;
        res.add_header("Content-Type", "application/json");
        add_cors_headers(res, *ctx);

        if (ctx->config) {
          res.body = config_to_json(*ctx->config);
          res.code = 200;
        } else {
          res.body = make_error_json("CONFIG_UNAVAILABLE",
                                     "Configuration not available");
          res.code = 500;
        }
        return res;
      });
}

} // namespace bitcrush::web::endpoints
