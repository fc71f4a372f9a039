/**
 * @file auth_endpoints.cpp
 * @brief Identity API endpoints implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any osmock headers to avoid forward
// declaration conflicts
#include "endpoint_support.hpp"

#include "osmock/security/auth_service.hpp"
#include "osmock/security/credential_gate.hpp"
#include "osmock/web/rest_server_context.hpp"

namespace osmock::web::endpoints {

void register_auth_endpoints_impl(crow_app &app,
                                  std::shared_ptr<rest_server_context> ctx) {
  // POST /v3/auth/tokens - Password login
  CROW_ROUTE(app, "/v3/auth/tokens")
      .methods(crow::HTTPMethod::POST)([ctx](const crow::request &req) {
        if (!ctx->auth) {
          return unavailable_response(*ctx);
        }

        auto body = parse_json_body(req);
        if (body.is_err()) {
          return detail_response(*ctx, http_status::bad_request,
                                 "Malformed authentication body");
        }

        auto credentials = security::parse_password_credentials(body.value());
        if (credentials.is_err()) {
          return error_response(*ctx, credentials.error());
        }

        auto login = ctx->auth->login(credentials.value());
        if (login.is_err()) {
          return error_response(*ctx, login.error());
        }

        auto res = json_response(*ctx, http_status::ok, login.value());
        res.add_header(security::subject_token_header, login.value().token);
        return res;
      });

  // POST /v3/auth/logout - Revoke the presented token, if any
  CROW_ROUTE(app, "/v3/auth/logout")
      .methods(crow::HTTPMethod::POST)([ctx](const crow::request &req) {
        if (!ctx->auth) {
          return unavailable_response(*ctx);
        }

        auto token = req.get_header_value(security::auth_token_header);
        auto revoked = ctx->auth->logout(token);
        if (revoked.is_err()) {
          return error_response(*ctx, revoked.error());
        }
        return detail_response(*ctx, http_status::ok, "Logged out");
      });
}

} // namespace osmock::web::endpoints
