/**
 * @file image_endpoints.cpp
 * @brief Image upload and retrieval endpoints implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any bitcrush headers to avoid forward
// declaration conflicts
#include "crow.h"

#include "bitcrush/integration/logger_adapter.hpp"
#include "bitcrush/services/image_service.hpp"
#include "bitcrush/web/endpoints/image_endpoints.hpp"
#include "bitcrush/web/endpoints/system_endpoints.hpp"
#include "bitcrush/web/rest_config.hpp"
#include "bitcrush/web/rest_types.hpp"

#include <exception>
#include <memory>
#include <vector>

namespace bitcrush::web::endpoints {

using integration::logger_adapter;

namespace {

/**
 * @brief Add CORS headers to response
 */
void add_cors_headers(crow::response& res, const rest_server_context& ctx) {
    if (ctx.config != nullptr && ctx.config->enable_cors &&
        !ctx.config->cors_allowed_origins.empty()) {
        res.add_header("Access-Control-Allow-Origin",
                       ctx.config->cors_allowed_origins);
    }
}

/**
 * @brief Fill a JSON error response for an internal error
 */
void set_error(crow::response& res, std::string_view operation,
               const error_info& error) {
    logger_adapter::log_request_failure(operation, error.code, describe(error));

    auto mapped = to_api_error(error.code);
    res.code = static_cast<int>(mapped.status);
    res.set_header("Content-Type", "application/json");
    res.body = to_json(mapped.error);
}

void set_unavailable(crow::response& res) {
    res.code = static_cast<int>(http_status::service_unavailable);
    res.set_header("Content-Type", "application/json");
    res.body = make_error_json("SERVICE_UNAVAILABLE", "Image service not configured");
}

}  // namespace

// Internal implementation function called from rest_server.cpp
void register_image_endpoints_impl(crow::SimpleApp& app,
                                   std::shared_ptr<rest_server_context> ctx) {
    // POST /upload - raw image body, answers {"src":"/images/<id>.jpg"}
    CROW_ROUTE(app, "/upload")
        .methods(crow::HTTPMethod::POST)([ctx](const crow::request& req) {
            crow::response res;
            add_cors_headers(res, *ctx);

            if (ctx->images == nullptr) {
                set_unavailable(res);
                return res;
            }

            if (ctx->config != nullptr && req.body.size() > ctx->config->max_body_size) {
                logger_adapter::warn("upload rejected: {} bytes exceeds limit of {}",
                                     req.body.size(), ctx->config->max_body_size);
                res.code = static_cast<int>(http_status::payload_too_large);
                res.set_header("Content-Type", "application/json");
                res.body = make_error_json("PAYLOAD_TOO_LARGE", "Upload is too large");
                return res;
            }

            std::vector<std::uint8_t> upload(req.body.begin(), req.body.end());

            auto submitted = [&]() -> Result<std::string> {
                try {
                    return ctx->images->submit_async(std::move(upload)).get();
                } catch (const std::exception& e) {
                    return bitcrush_error<std::string>(
                        error_codes::transform_failed, "Transform pool failure", e.what());
                }
            }();

            if (submitted.is_err()) {
                set_error(res, "upload", submitted.error());
                return res;
            }

            res.code = static_cast<int>(http_status::ok);
            res.set_header("Content-Type", "application/json");
            res.body = make_upload_json(
                services::image_service::src_for(submitted.value()));
            return res;
        });

    // GET /images/<id>.jpg - stored artifact bytes
    CROW_ROUTE(app, "/images/<string>")
        .methods(crow::HTTPMethod::GET)(
            [ctx](const crow::request& /*req*/, const std::string& token) {
                crow::response res;
                add_cors_headers(res, *ctx);

                if (ctx->images == nullptr) {
                    set_unavailable(res);
                    return res;
                }

                auto found = ctx->images->retrieve(token);
                if (found.is_err()) {
                    set_error(res, "lookup", found.error());
                    return res;
                }

                const auto& item = found.value();
                res.code = static_cast<int>(http_status::ok);
                res.set_header("Content-Type", item.content_type);
                res.body = std::string(
                    reinterpret_cast<const char*>(item.data.data()), item.data.size());
                return res;
            });
}

}  // namespace bitcrush::web::endpoints
