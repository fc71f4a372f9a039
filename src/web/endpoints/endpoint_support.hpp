/**
 * @file endpoint_support.hpp
 * @brief Response and authorization helpers shared by the endpoints
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "osmock/web/endpoints/route_registration.hpp"

#include "osmock/core/result.hpp"
#include "osmock/web/rest_types.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace osmock::web {

struct rest_server_context;

namespace endpoints {

/**
 * @brief Add CORS headers to response
 */
void add_cors_headers(crow::response &res, const rest_server_context &ctx);

/**
 * @brief JSON response with CORS headers
 */
crow::response json_response(const rest_server_context &ctx,
                             http_status status, const nlohmann::json &body);

/**
 * @brief {"detail": message} response with the given status
 */
crow::response detail_response(const rest_server_context &ctx,
                               http_status status, std::string_view message);

/**
 * @brief Response for a failed operation, status chosen by error code
 */
crow::response error_response(const rest_server_context &ctx,
                              const error_info &error);

/**
 * @brief 503 response naming the missing service
 */
crow::response unavailable_response(const rest_server_context &ctx);

/**
 * @brief Check the X-Auth-Token header of a protected request
 *
 * @return true if the request may proceed; otherwise @p res holds the
 *         401 (or 503) response to send
 */
bool authorize(const rest_server_context &ctx, const crow::request &req,
               crow::response &res);

/**
 * @brief Parse the request body as JSON
 * @return The document, or error_codes::bad_request if it is not valid JSON
 */
Result<nlohmann::json> parse_json_body(const crow::request &req);

// =========================================================================
// Collection routes
// =========================================================================

/**
 * @brief Authorize, parse, build and store a new entity
 *
 * @param parse Body parser returning Result<request type>
 * @param make Builds the record from the parsed request
 * @param status Status of a successful create
 */
template <typename Collection, typename Parse, typename Make>
crow::response create_entity(const rest_server_context &ctx,
                             Collection *collection, const crow::request &req,
                             Parse parse, Make make, http_status status) {
  crow::response res;
  if (!authorize(ctx, req, res)) {
    return res;
  }
  if (collection == nullptr) {
    return unavailable_response(ctx);
  }

  auto body = parse_json_body(req);
  if (body.is_err()) {
    return error_response(ctx, body.error());
  }
  auto request = parse(body.value());
  if (request.is_err()) {
    return error_response(ctx, request.error());
  }

  auto created = collection->create(make(request.value()));
  if (created.is_err()) {
    return error_response(ctx, created.error());
  }
  return json_response(ctx, status, created.value());
}

template <typename Collection>
crow::response get_entity(const rest_server_context &ctx,
                          Collection *collection, const crow::request &req,
                          const std::string &id) {
  crow::response res;
  if (!authorize(ctx, req, res)) {
    return res;
  }
  if (collection == nullptr) {
    return unavailable_response(ctx);
  }

  auto entity = collection->get(id);
  if (entity.is_err()) {
    return error_response(ctx, entity.error());
  }
  return json_response(ctx, http_status::ok, entity.value());
}

/**
 * @brief Delete by id; answers {"detail":"Deleted"}
 */
template <typename Collection>
crow::response delete_entity(const rest_server_context &ctx,
                             Collection *collection, const crow::request &req,
                             const std::string &id) {
  crow::response res;
  if (!authorize(ctx, req, res)) {
    return res;
  }
  if (collection == nullptr) {
    return unavailable_response(ctx);
  }

  auto removed = collection->remove(id);
  if (removed.is_err()) {
    return error_response(ctx, removed.error());
  }
  return detail_response(ctx, http_status::ok, "Deleted");
}

} // namespace endpoints

} // namespace osmock::web
