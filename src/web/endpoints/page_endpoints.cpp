/**
 * @file page_endpoints.cpp
 * @brief Static page endpoints implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any bitcrush headers to avoid forward
// declaration conflicts
#include "crow.h"

#include "bitcrush/integration/logger_adapter.hpp"
#include "bitcrush/web/endpoints/page_endpoints.hpp"
#include "bitcrush/web/endpoints/system_endpoints.hpp"
#include "bitcrush/web/rest_types.hpp"
#include "bitcrush/web/template_registry.hpp"

#include <memory>

namespace bitcrush::web::endpoints {

using integration::logger_adapter;

namespace {

bool ends_with(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() &&
         text.substr(text.size() - suffix.size()) == suffix;
}

/**
 * @brief Render a template into a response
 *
 * Any failure yields a plain 500 with the generic apology.
 */
crow::response render_page(const rest_server_context &ctx,
                           std::string_view name) {
  crow::response res;

  if (!ctx.templates) {
    logger_adapter::error("page {} requested without templates", name);
    res.code = static_cast<int>(http_status::internal_server_error);
    res.body = std::string(kGenericFailureMessage);
    return res;
  }

  auto rendered = ctx.templates->render(name);
  if (rendered.is_err()) {
    const auto &error = rendered.error();
    logger_adapter::log_request_failure("render", error.code, describe(error));
    res.code = static_cast<int>(http_status::internal_server_error);
    res.body = std::string(kGenericFailureMessage);
    return res;
  }

  res.code = static_cast<int>(http_status::ok);
  res.set_header("Content-Type", page_content_type(name));
  res.body = std::move(rendered.value());
  return res;
}

} // namespace

std::string page_content_type(std::string_view template_name) {
  if (ends_with(template_name, ".html")) {
    return "text/html; charset=utf-8";
  }
  if (ends_with(template_name, ".css")) {
    return "text/css; charset=utf-8";
  }
  if (ends_with(template_name, ".js")) {
    return "text/javascript; charset=utf-8";
  }
  return "text/plain; charset=utf-8";
}

// Internal implementation function called from rest_server.cpp
void register_page_endpoints_impl(crow::SimpleApp &app,
                                  std::shared_ptr<rest_server_context> ctx) {
  // GET / - upload page
  CROW_ROUTE(app, "/").methods(crow::HTTPMethod::GET)(
      [ctx]() { return render_page(*ctx, "index.html"); });

  // GET /style.css
  CROW_ROUTE(app, "/style.css").methods(crow::HTTPMethod::GET)(
      [ctx]() { return render_page(*ctx, "style.css"); });

  // GET /main.js
  CROW_ROUTE(app, "/main.js").methods(crow::HTTPMethod::GET)(
      [ctx]() { return render_page(*ctx, "main.js"); });
}

} // namespace bitcrush::web::endpoints
