/**
 * @file image_endpoints.hpp
 * @brief Image upload and retrieval endpoints
 *
 * POST /upload takes a raw image body (JPEG, PNG, GIF, WebP, TIFF or
 * BMP) and answers with the public reference of the degraded copy.
 * GET /images/<id>.jpg serves it.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <memory>

namespace bitcrush::services {
class image_service;
}  // namespace bitcrush::services

namespace bitcrush::web {

struct rest_server_context;

namespace endpoints {

// Internal function - implementation in cpp file
// Registers image endpoints with the Crow app
// Called from rest_server.cpp

}  // namespace endpoints

}  // namespace bitcrush::web
