/**
 * @file page_endpoints.hpp
 * @brief Static page endpoints rendered from templates
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <string>
#include <string_view>

namespace bitcrush::web {

struct rest_server_context;
class template_registry;

namespace endpoints {

/**
 * @brief Content-Type header for a rendered template
 *
 * Chosen from the extension of the template name: ".html", ".css" and
 * ".js" map to their text types with a utf-8 charset, anything else to
 * text/plain.
 */
[[nodiscard]] std::string page_content_type(std::string_view template_name);

// Internal function - implementation in cpp file
// Registers page endpoints with the Crow app
// Called from rest_server.cpp

}  // namespace endpoints

}  // namespace bitcrush::web
