/**
 * @file rest_config.hpp
 * @brief Configuration for the REST API server
 *
 * This file provides configuration options for the REST API server
 * including bind address, port, concurrency and CORS settings.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace osmock::web {

/// Upper bound accepted for rest_server_config::concurrency
inline constexpr std::size_t max_concurrency = 256;

/**
 * @struct rest_server_config
 * @brief Configuration options for the REST server
 */
struct rest_server_config {
  /// Address to bind the server to
  std::string bind_address{"0.0.0.0"};

  /// Port to listen on
  std::uint16_t port{8000};

  /// Number of worker threads for handling requests, 1..max_concurrency
  std::size_t concurrency{4};

  /// Enable CORS (Cross-Origin Resource Sharing) headers
  bool enable_cors{true};

  /// CORS allowed origins (empty = no header)
  std::string cors_allowed_origins{"*"};
};

} // namespace osmock::web
