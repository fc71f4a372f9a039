/**
 * @file rest_server_test.cpp
 * @brief Unit tests for REST server
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#include <catch2/catch_test_macros.hpp>

#include "osmock/storage/resource_store.hpp"
#include "osmock/web/rest_config.hpp"
#include "osmock/web/rest_server.hpp"

#include "../mocks/memory_json_storage.hpp"

#include <chrono>
#include <thread>

using namespace osmock::web;

TEST_CASE("rest_server_config default values", "[web][config]") {
  rest_server_config config;

  REQUIRE(config.bind_address == "0.0.0.0");
  REQUIRE(config.port == 8000);
  REQUIRE(config.concurrency == 4);
  REQUIRE(config.enable_cors == true);
  REQUIRE(config.cors_allowed_origins == "*");
}

TEST_CASE("rest_server construction", "[web][server]") {
  SECTION("default construction") {
    rest_server server;
    REQUIRE(server.config().port == 8000);
    REQUIRE_FALSE(server.is_running());
    REQUIRE(server.port() == 0);
  }

  SECTION("construction with config") {
    rest_server_config config;
    config.port = 9090;

    rest_server server(config);
    REQUIRE(server.config().port == 9090);
    REQUIRE_FALSE(server.is_running());
  }
}

TEST_CASE("rest_server config update", "[web][server]") {
  rest_server server;

  rest_server_config new_config;
  new_config.port = 9999;
  new_config.concurrency = 16;

  server.set_config(new_config);
  REQUIRE(server.config().port == 9999);
  REQUIRE(server.config().concurrency == 16);
}

TEST_CASE("rest_server async lifecycle", "[web][server][async]") {
  rest_server_config config;
  config.bind_address = "127.0.0.1";
  config.port = 18000; // Use high port to avoid conflicts
  config.concurrency = 1;

  rest_server server(config);
  REQUIRE(server
              .set_store(std::make_shared<osmock::storage::resource_store>(
                  std::make_shared<osmock::storage::testing::memory_json_storage>()))
              .is_ok());

  SECTION("start and stop async") {
    REQUIRE_FALSE(server.is_running());

    server.start_async();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    REQUIRE(server.is_running());
    REQUIRE(server.port() == 18000);

    server.stop();
    REQUIRE_FALSE(server.is_running());
  }

  SECTION("store cannot be replaced while running") {
    server.start_async();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto replaced =
        server.set_store(std::make_shared<osmock::storage::resource_store>(
            std::make_shared<osmock::storage::testing::memory_json_storage>()));
    REQUIRE(replaced.is_err());
    REQUIRE(replaced.error().code == osmock::error_codes::conflict);
    REQUIRE(server.is_running());

    server.stop();
    REQUIRE_FALSE(server.is_running());

    // Allowed again once stopped
    REQUIRE(server
                .set_store(std::make_shared<osmock::storage::resource_store>(
                    std::make_shared<osmock::storage::testing::memory_json_storage>()))
                .is_ok());
  }

  SECTION("stop without start is safe") {
    server.stop();
    REQUIRE_FALSE(server.is_running());
  }

  SECTION("double start is safe") {
    server.start_async();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    server.start_async(); // Second start is a no-op
    REQUIRE(server.is_running());

    server.stop();
    REQUIRE_FALSE(server.is_running());
  }
}
