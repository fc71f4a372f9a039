/**
 * @file rest_server.cpp
 * @brief REST API server implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any osmock headers to avoid forward
// declaration conflicts
#include "osmock/web/endpoints/route_registration.hpp"

#include "osmock/integration/logger_adapter.hpp"
#include "osmock/security/auth_service.hpp"
#include "osmock/security/credential_gate.hpp"
#include "osmock/services/attachment_service.hpp"
#include "osmock/storage/resource_store.hpp"
#include "osmock/web/rest_config.hpp"
#include "osmock/web/rest_server.hpp"
#include "osmock/web/rest_server_context.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

namespace osmock::web {

using integration::logger_adapter;

std::shared_ptr<rest_server_context>
make_rest_server_context(std::shared_ptr<storage::resource_store> store,
                         const rest_server_config *config) {
  auto ctx = std::make_shared<rest_server_context>();
  ctx->config = config;
  if (!store) {
    return ctx;
  }

  ctx->gate = std::make_shared<security::credential_gate>(store);
  ctx->auth = std::make_shared<security::auth_service>(store);
  ctx->images = std::make_shared<services::image_collection>(
      store, &storage::store_state::images, "Image");
  ctx->volumes = std::make_shared<services::volume_collection>(
      store, &storage::store_state::volumes, "Volume");
  ctx->servers = std::make_shared<services::server_collection>(
      store, &storage::store_state::servers, "Server");
  ctx->attachments = std::make_shared<services::attachment_service>(store);
  return ctx;
}

/**
 * @brief Implementation details for rest_server
 */
struct rest_server::impl {
  rest_server_config config;
  std::shared_ptr<rest_server_context> context;
  std::unique_ptr<crow_app> app;
  std::thread server_thread;
  std::atomic<bool> running{false};
  std::mutex mutex;

  impl() : context(make_rest_server_context(nullptr, &config)) {}

  explicit impl(const rest_server_config &cfg)
      : config(cfg), context(make_rest_server_context(nullptr, &config)) {}

  void prepare() {
    std::lock_guard<std::mutex> lock(mutex);
    app = std::make_unique<crow_app>();
    endpoints::register_all_endpoints(*app, context);
  }

  void run() {
    logger_adapter::info("REST server listening on {}:{}", config.bind_address,
                         config.port);

    const auto threads = std::clamp<std::size_t>(config.concurrency, 1,
                                                 max_concurrency);
    app->bindaddr(config.bind_address)
        .port(config.port)
        .concurrency(static_cast<std::uint16_t>(threads))
        .run();

    running = false;
    logger_adapter::info("REST server stopped");
  }
};

rest_server::rest_server() : impl_(std::make_unique<impl>()) {}

rest_server::rest_server(const rest_server_config &config)
    : impl_(std::make_unique<impl>(config)) {}

rest_server::~rest_server() {
  if (impl_) {
    stop();
  }
}

rest_server::rest_server(rest_server &&other) noexcept = default;
rest_server &rest_server::operator=(rest_server &&other) noexcept = default;

const rest_server_config &rest_server::config() const noexcept {
  return impl_->config;
}

void rest_server::set_config(const rest_server_config &config) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config = config;
  impl_->context->config = &impl_->config;
}

VoidResult
rest_server::set_store(std::shared_ptr<storage::resource_store> store) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->running) {
    return osmock_void_error(error_codes::conflict,
                             "Cannot replace the store of a running server");
  }
  impl_->context = make_rest_server_context(std::move(store), &impl_->config);
  return ok();
}

void rest_server::start() {
  if (impl_->running.exchange(true)) {
    return; // Already running
  }
  impl_->prepare();
  impl_->run();
}

void rest_server::start_async() {
  if (impl_->running.exchange(true)) {
    return; // Already running
  }
  impl_->prepare();
  impl_->server_thread = std::thread([this]() { impl_->run(); });
}

void rest_server::stop() {
  if (impl_->running && impl_->app) {
    impl_->app->stop();
  }

  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }

  impl_->running = false;
}

bool rest_server::is_running() const noexcept { return impl_->running; }

void rest_server::wait() {
  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }
}

std::uint16_t rest_server::port() const noexcept {
  return impl_->running ? impl_->config.port : 0;
}

} // namespace osmock::web
