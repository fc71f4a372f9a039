/**
 * @file rest_server.hpp
 * @brief REST API server for the mock cloud endpoints
 *
 * This file provides the rest_server class that serves the identity,
 * image, volume and compute routes using the Crow framework.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "rest_config.hpp"

#include <osmock/core/result.hpp>

#include <cstdint>
#include <memory>

namespace osmock::storage {
class resource_store;
} // namespace osmock::storage

namespace osmock::web {

/**
 * @class rest_server
 * @brief REST API server over a resource store
 *
 * @par Example
 * @code
 * #include <osmock/web/rest_server.hpp>
 *
 * rest_server_config config;
 * config.port = 8000;
 *
 * rest_server server(config);
 * if (auto set = server.set_store(store); set.is_err()) {
 *   // handle error
 * }
 *
 * server.start_async();  // Non-blocking
 * // ... do other work ...
 * server.stop();
 * @endcode
 */
class rest_server {
public:
  /**
   * @brief Construct REST server with default configuration
   */
  rest_server();

  /**
   * @brief Construct REST server with custom configuration
   * @param config Server configuration
   */
  explicit rest_server(const rest_server_config &config);

  /**
   * @brief Destructor - stops server if running
   */
  ~rest_server();

  /// Non-copyable
  rest_server(const rest_server &) = delete;
  rest_server &operator=(const rest_server &) = delete;

  /// Movable
  rest_server(rest_server &&other) noexcept;
  rest_server &operator=(rest_server &&other) noexcept;

  // =========================================================================
  // Configuration
  // =========================================================================

  [[nodiscard]] const rest_server_config &config() const noexcept;

  /**
   * @brief Update configuration (requires restart to apply)
   * @param config New configuration
   */
  void set_config(const rest_server_config &config);

  // =========================================================================
  // Integration
  // =========================================================================

  /**
   * @brief Set the store behind every endpoint
   *
   * Builds the credential gate, auth service, collections and attachment
   * service over @p store. Until this is called every route answers 503.
   *
   * Routes capture the services when the server starts, so the store
   * can only be set while the server is stopped.
   *
   * @return error_codes::conflict if the server is running
   */
  [[nodiscard]] VoidResult
  set_store(std::shared_ptr<storage::resource_store> store);

  // =========================================================================
  // Lifecycle
  // =========================================================================

  /**
   * @brief Start the server (blocking)
   *
   * This method blocks until stop() is called from another thread.
   */
  void start();

  /**
   * @brief Start the server (non-blocking)
   *
   * Starts the server in a background thread and returns immediately.
   */
  void start_async();

  /**
   * @brief Stop the server
   *
   * Gracefully shuts down the server. Safe to call multiple times.
   */
  void stop();

  [[nodiscard]] bool is_running() const noexcept;

  /**
   * @brief Wait for server to stop
   *
   * Only valid after start_async() was called.
   */
  void wait();

  /**
   * @brief Get the port the server is listening on
   * @return Port number, or 0 if not running
   */
  [[nodiscard]] std::uint16_t port() const noexcept;

private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

} // namespace osmock::web
