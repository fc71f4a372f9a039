/**
 * @file route_registration.hpp
 * @brief Registration of the REST routes on a Crow application
 *
 * Used by rest_server and by tests that drive the routes in-process.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

// IMPORTANT: Include Crow FIRST before any osmock headers
#include "crow.h"

#ifdef DELETE
#undef DELETE
#endif

#include <memory>

namespace osmock::web {

struct rest_server_context;

/**
 * @brief Crow middleware that turns OPTIONS replies into CORS preflights
 *
 * Crow answers OPTIONS requests itself, listing the methods routed for
 * the path, and never calls a route handler for them. The preflight
 * headers are therefore attached in after_handle, which runs for those
 * replies too. Paths with no route still get a 204 preflight.
 */
struct cors_preflight {
  struct context {};

  /// Source of the CORS settings; nothing is added while null
  std::shared_ptr<rest_server_context> server_context;

  void before_handle(crow::request &req, crow::response &res, context &ctx);
  void after_handle(crow::request &req, crow::response &res, context &ctx);
};

/// Crow application type every route is registered on
using crow_app = crow::App<cors_preflight>;

namespace endpoints {

/// POST /v3/auth/tokens, POST /v3/auth/logout
void register_auth_endpoints_impl(crow_app &app,
                                  std::shared_ptr<rest_server_context> ctx);

/// /v2/images[/<id>]
void register_image_endpoints_impl(crow_app &app,
                                   std::shared_ptr<rest_server_context> ctx);

/// /v3/volumes[/<id>]
void register_volume_endpoints_impl(crow_app &app,
                                    std::shared_ptr<rest_server_context> ctx);

/// /v2.1/servers[/<id>]
void register_server_endpoints_impl(crow_app &app,
                                    std::shared_ptr<rest_server_context> ctx);

/// /v2.1/servers/<id>/os-volume_attachments[/<attachment id>]
void register_attachment_endpoints_impl(crow_app &app,
                                        std::shared_ptr<rest_server_context> ctx);

/// Hand @p ctx to the cors_preflight middleware of @p app
void register_cors_preflight_impl(crow_app &app,
                                  std::shared_ptr<rest_server_context> ctx);

/**
 * @brief Register every route above
 */
void register_all_endpoints(crow_app &app,
                            std::shared_ptr<rest_server_context> ctx);

} // namespace endpoints

} // namespace osmock::web
