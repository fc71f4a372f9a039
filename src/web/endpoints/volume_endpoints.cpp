/**
 * @file volume_endpoints.cpp
 * @brief Block storage API endpoints implementation
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

void register_volume_endpoints_impl(crow_app &app,
                                    std::shared_ptr<rest_server_context> ctx) {
  // GET /v3/volumes - List volumes
  CROW_ROUTE(app, "/v3/volumes")
      .methods(crow::HTTPMethod::GET)([ctx](const crow::request &req) {
        crow::response res;
        if (!authorize(*ctx, req, res)) {
          return res;
        }
        if (!ctx->volumes) {
          return unavailable_response(*ctx);
        }
        nlohmann::json volumes = ctx->volumes->list();
        return json_response(*ctx, http_status::ok, {{"volumes", volumes}});
      });

  // POST /v3/volumes - Create volume
  CROW_ROUTE(app, "/v3/volumes")
      .methods(crow::HTTPMethod::POST)([ctx](const crow::request &req) {
        return create_entity(*ctx, ctx->volumes.get(), req,
                             services::parse_volume_request,
                             services::make_volume, http_status::created);
      });

  // GET /v3/volumes/:id - Volume details
  CROW_ROUTE(app, "/v3/volumes/<string>")
      .methods(crow::HTTPMethod::GET)(
          [ctx](const crow::request &req, const std::string &volume_id) {
            return get_entity(*ctx, ctx->volumes.get(), req, volume_id);
          });

  // DELETE /v3/volumes/:id - Delete volume
  CROW_ROUTE(app, "/v3/volumes/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [ctx](const crow::request &req, const std::string &volume_id) {
            return delete_entity(*ctx, ctx->volumes.get(), req, volume_id);
          });
}

} // namespace osmock::web::endpoints
