/**
 * @file endpoint_support.cpp
 * @brief Response and authorization helpers shared by the endpoints
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#include "endpoint_support.hpp"

#include "osmock/security/credential_gate.hpp"
#include "osmock/web/rest_config.hpp"
#include "osmock/web/rest_server_context.hpp"

namespace osmock::web {

std::string make_detail_json(std::string_view message) {
  return nlohmann::json{{"detail", std::string(message)}}.dump(
      -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

namespace endpoints {

void add_cors_headers(crow::response &res, const rest_server_context &ctx) {
  if (ctx.config && ctx.config->enable_cors &&
      !ctx.config->cors_allowed_origins.empty()) {
    res.add_header("Access-Control-Allow-Origin",
                   ctx.config->cors_allowed_origins);
  }
}

crow::response json_response(const rest_server_context &ctx,
                             http_status status, const nlohmann::json &body) {
  crow::response res;
  res.add_header("Content-Type", "application/json");
  add_cors_headers(res, ctx);
  res.code = static_cast<int>(status);
  res.body =
      body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return res;
}

crow::response detail_response(const rest_server_context &ctx,
                               http_status status, std::string_view message) {
  crow::response res;
  res.add_header("Content-Type", "application/json");
  add_cors_headers(res, ctx);
  res.code = static_cast<int>(status);
  res.body = make_detail_json(message);
  return res;
}

crow::response error_response(const rest_server_context &ctx,
                              const error_info &error) {
  return detail_response(ctx, status_for_error(error.code), error.message);
}

crow::response unavailable_response(const rest_server_context &ctx) {
  return detail_response(ctx, http_status::service_unavailable,
                         "Resource store not configured");
}

bool authorize(const rest_server_context &ctx, const crow::request &req,
               crow::response &res) {
  if (!ctx.gate) {
    res = unavailable_response(ctx);
    return false;
  }

  auto token = req.get_header_value(security::auth_token_header);
  auto checked = ctx.gate->authenticate(token);
  if (checked.is_err()) {
    res = error_response(ctx, checked.error());
    return false;
  }
  return true;
}

Result<nlohmann::json> parse_json_body(const crow::request &req) {
  auto body = nlohmann::json::parse(req.body, nullptr, false);
  if (body.is_discarded()) {
    return osmock_error<nlohmann::json>(error_codes::bad_request,
                                        "Request body is not valid JSON");
  }
  return ok(std::move(body));
}

} // namespace endpoints

} // namespace osmock::web
