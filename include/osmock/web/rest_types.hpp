/**
 * @file rest_types.hpp
 * @brief Common types and error mapping for the REST API
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <osmock/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace osmock::web {

/**
 * @enum http_status
 * @brief HTTP status codes produced by the API
 */
enum class http_status : std::uint16_t {
  // Success
  ok = 200,
  created = 201,
  accepted = 202,
  no_content = 204,

  // Client errors
  bad_request = 400,
  unauthorized = 401,
  not_found = 404,
  conflict = 409,

  // Server errors
  internal_server_error = 500,
  service_unavailable = 503
};

/**
 * @brief HTTP status for an osmock error code
 *
 * Client error codes map to their 4xx counterpart; anything else is a
 * server fault.
 */
[[nodiscard]] constexpr http_status status_for_error(int code) noexcept {
  switch (code) {
  case error_codes::bad_request:
    return http_status::bad_request;
  case error_codes::unauthorized:
    return http_status::unauthorized;
  case error_codes::not_found:
    return http_status::not_found;
  case error_codes::conflict:
    return http_status::conflict;
  default:
    return http_status::internal_server_error;
  }
}

/**
 * @brief Error body in the form {"detail": "<message>"}
 */
[[nodiscard]] std::string make_detail_json(std::string_view message);

} // namespace osmock::web
