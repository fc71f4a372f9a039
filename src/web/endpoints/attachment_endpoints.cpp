/**
 * @file attachment_endpoints.cpp
 * @brief Volume attachment API endpoints implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any osmock headers to avoid forward
// declaration conflicts
#include "endpoint_support.hpp"

#include "osmock/services/attachment_service.hpp"
#include "osmock/web/rest_server_context.hpp"

namespace osmock::web::endpoints {

void register_attachment_endpoints_impl(
    crow_app &app, std::shared_ptr<rest_server_context> ctx) {
  // POST /v2.1/servers/:id/os-volume_attachments - Attach volume
  CROW_ROUTE(app, "/v2.1/servers/<string>/os-volume_attachments")
      .methods(crow::HTTPMethod::POST)(
          [ctx](const crow::request &req, const std::string &server_id) {
            crow::response res;
            if (!authorize(*ctx, req, res)) {
              return res;
            }
            if (!ctx->attachments) {
              return unavailable_response(*ctx);
            }

            auto body = parse_json_body(req);
            if (body.is_err()) {
              return error_response(*ctx, body.error());
            }
            auto request = services::parse_attach_request(body.value());
            if (request.is_err()) {
              return error_response(*ctx, request.error());
            }

            auto attached = ctx->attachments->attach(server_id, request.value());
            if (attached.is_err()) {
              return error_response(*ctx, attached.error());
            }
            return json_response(*ctx, http_status::accepted,
                                 {{"volumeAttachment", attached.value()}});
          });

  // GET /v2.1/servers/:id/os-volume_attachments - List attachments
  CROW_ROUTE(app, "/v2.1/servers/<string>/os-volume_attachments")
      .methods(crow::HTTPMethod::GET)(
          [ctx](const crow::request &req, const std::string &server_id) {
            crow::response res;
            if (!authorize(*ctx, req, res)) {
              return res;
            }
            if (!ctx->attachments) {
              return unavailable_response(*ctx);
            }

            nlohmann::json attachments = ctx->attachments->list(server_id);
            return json_response(*ctx, http_status::ok,
                                 {{"volumeAttachments", attachments}});
          });

  // DELETE /v2.1/servers/:id/os-volume_attachments/:attachment_id - Detach
  CROW_ROUTE(app, "/v2.1/servers/<string>/os-volume_attachments/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [ctx](const crow::request &req, const std::string &server_id,
                const std::string &attachment_id) {
            crow::response res;
            if (!authorize(*ctx, req, res)) {
              return res;
            }
            if (!ctx->attachments) {
              return unavailable_response(*ctx);
            }

            auto detached = ctx->attachments->detach(server_id, attachment_id);
            if (detached.is_err()) {
              return error_response(*ctx, detached.error());
            }

            crow::response done(static_cast<int>(http_status::no_content));
            add_cors_headers(done, *ctx);
            return done;
          });
}

} // namespace osmock::web::endpoints
