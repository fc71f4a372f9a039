/**
 * @file server_endpoints.cpp
 * @brief Compute API endpoints implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any osmock headers to avoid forward
// declaration conflicts
#include "endpoint_support.hpp"

#include "osmock/services/resource_requests.hpp"
#include "osmock/web/rest_server_context.hpp"

namespace osmock::web::endpoints {

void register_server_endpoints_impl(crow_app &app,
                                    std::shared_ptr<rest_server_context> ctx) {
  // GET /v2.1/servers - List servers
  CROW_ROUTE(app, "/v2.1/servers")
      .methods(crow::HTTPMethod::GET)([ctx](const crow::request &req) {
        crow::response res;
        if (!authorize(*ctx, req, res)) {
          return res;
        }
        if (!ctx->servers) {
          return unavailable_response(*ctx);
        }
        nlohmann::json servers = ctx->servers->list();
        return json_response(*ctx, http_status::ok, {{"servers", servers}});
      });

  // POST /v2.1/servers - Boot server (accepted, stays in BUILD)
  CROW_ROUTE(app, "/v2.1/servers")
      .methods(crow::HTTPMethod::POST)([ctx](const crow::request &req) {
        return create_entity(*ctx, ctx->servers.get(), req,
                             services::parse_server_request,
                             services::make_server, http_status::accepted);
      });

  // GET /v2.1/servers/:id - Server details
  CROW_ROUTE(app, "/v2.1/servers/<string>")
      .methods(crow::HTTPMethod::GET)(
          [ctx](const crow::request &req, const std::string &server_id) {
            return get_entity(*ctx, ctx->servers.get(), req, server_id);
          });

  // DELETE /v2.1/servers/:id - Delete server
  CROW_ROUTE(app, "/v2.1/servers/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [ctx](const crow::request &req, const std::string &server_id) {
            return delete_entity(*ctx, ctx->servers.get(), req, server_id);
          });
}

} // namespace osmock::web::endpoints
