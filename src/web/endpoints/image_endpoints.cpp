/**
 * @file image_endpoints.cpp
 * @brief Image API endpoints implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any osmock headers to avoid forward
// declaration conflicts
#include "endpoint_support.hpp"

#include "osmock/core/identifiers.hpp"
#include "osmock/services/resource_requests.hpp"
#include "osmock/web/rest_server_context.hpp"

namespace osmock::web::endpoints {

namespace {

/**
 * @brief List element: the stored image plus a self link
 */
nlohmann::json image_summary(const storage::image_record &image) {
  nlohmann::json j = image;
  if (image.created_at.empty()) {
    j["created_at"] = core::now_iso8601();
  }
  nlohmann::json self = {{"rel", "self"}, {"href", "/v2/images/" + image.id}};
  j["links"] = nlohmann::json::array({self});
  return j;
}

} // namespace

void register_image_endpoints_impl(crow_app &app,
                                   std::shared_ptr<rest_server_context> ctx) {
  // GET /v2/images - List images
  CROW_ROUTE(app, "/v2/images")
      .methods(crow::HTTPMethod::GET)([ctx](const crow::request &req) {
        crow::response res;
        if (!authorize(*ctx, req, res)) {
          return res;
        }
        if (!ctx->images) {
          return unavailable_response(*ctx);
        }

        auto images = nlohmann::json::array();
        for (const auto &image : ctx->images->list()) {
          images.push_back(image_summary(image));
        }
        return json_response(*ctx, http_status::ok, {{"images", images}});
      });

  // POST /v2/images - Register image metadata
  CROW_ROUTE(app, "/v2/images")
      .methods(crow::HTTPMethod::POST)([ctx](const crow::request &req) {
        return create_entity(*ctx, ctx->images.get(), req,
                             services::parse_image_request,
                             services::make_image, http_status::created);
      });

  // GET /v2/images/:id - Image details
  CROW_ROUTE(app, "/v2/images/<string>")
      .methods(crow::HTTPMethod::GET)(
          [ctx](const crow::request &req, const std::string &image_id) {
            return get_entity(*ctx, ctx->images.get(), req, image_id);
          });

  // DELETE /v2/images/:id - Remove image
  CROW_ROUTE(app, "/v2/images/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [ctx](const crow::request &req, const std::string &image_id) {
            return delete_entity(*ctx, ctx->images.get(), req, image_id);
          });
}

} // namespace osmock::web::endpoints
