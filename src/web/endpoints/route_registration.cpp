/**
 * @file route_registration.cpp
 * @brief Registration of every REST route
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any osmock headers to avoid forward
// declaration conflicts
#include "osmock/web/endpoints/route_registration.hpp"

#include "osmock/security/auth_service.hpp"
#include "osmock/security/credential_gate.hpp"
#include "osmock/web/rest_config.hpp"
#include "osmock/web/rest_server_context.hpp"

#include <string>
#include <utility>

namespace osmock::web {

void cors_preflight::before_handle(crow::request & /*req*/,
                                   crow::response & /*res*/,
                                   context & /*ctx*/) {}

void cors_preflight::after_handle(crow::request &req, crow::response &res,
                                  context & /*ctx*/) {
  if (req.method != crow::HTTPMethod::OPTIONS || !server_context) {
    return;
  }
  const auto *config = server_context->config;
  if (!config || !config->enable_cors) {
    return;
  }

  res.code = 204;
  res.body.clear();
  res.set_header("Access-Control-Allow-Origin", config->cors_allowed_origins);
  res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
  res.set_header("Access-Control-Allow-Headers",
                 std::string("Content-Type, ") + security::auth_token_header);
  res.set_header("Access-Control-Expose-Headers",
                 security::subject_token_header);
  res.set_header("Access-Control-Max-Age", "86400");
}

namespace endpoints {

void register_cors_preflight_impl(crow_app &app,
                                  std::shared_ptr<rest_server_context> ctx) {
  app.get_middleware<cors_preflight>().server_context = std::move(ctx);
}

void register_all_endpoints(crow_app &app,
                            std::shared_ptr<rest_server_context> ctx) {
  register_auth_endpoints_impl(app, ctx);
  register_image_endpoints_impl(app, ctx);
  register_volume_endpoints_impl(app, ctx);
  register_server_endpoints_impl(app, ctx);
  register_attachment_endpoints_impl(app, ctx);
  register_cors_preflight_impl(app, ctx);
}

} // namespace endpoints

} // namespace osmock::web
