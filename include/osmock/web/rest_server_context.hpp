/**
 * @file rest_server_context.hpp
 * @brief Shared state handed to every REST endpoint
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <osmock/services/resource_collection.hpp>

#include <memory>

namespace osmock::security {
class auth_service;
class credential_gate;
} // namespace osmock::security

namespace osmock::services {
class attachment_service;
} // namespace osmock::services

namespace osmock::web {

struct rest_server_config;

/**
 * @struct rest_server_context
 * @brief Shared context for REST endpoints
 *
 * Endpoints answer 503 while a service they need is not set.
 */
struct rest_server_context {
  /// Current server configuration (read-only)
  const rest_server_config *config{nullptr};

  /// Token check for protected routes
  std::shared_ptr<security::credential_gate> gate;

  /// Login and logout
  std::shared_ptr<security::auth_service> auth;

  std::shared_ptr<services::image_collection> images;
  std::shared_ptr<services::volume_collection> volumes;
  std::shared_ptr<services::server_collection> servers;
  std::shared_ptr<services::attachment_service> attachments;
};

/**
 * @brief Build a context with every service wired to @p store
 * @param store Resource store shared by all services
 * @param config Configuration the context points at; may be null
 */
[[nodiscard]] std::shared_ptr<rest_server_context>
make_rest_server_context(std::shared_ptr<storage::resource_store> store,
                         const rest_server_config *config);

} // namespace osmock::web
