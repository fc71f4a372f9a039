/**
 * @file main.cpp
 * @brief Entry point for the OpenStack mock server
 *
 * Serves the identity, image, block storage and compute routes over HTTP,
 * persisting all state as JSON documents in the data directory.
 *
 * Usage:
 *   osmock_server [OPTIONS]
 *
 * Options:
 *   --port <port>           Port to listen on (default: 8000)
 *   --bind <address>        Bind address (default: 0.0.0.0)
 *   --data-dir <path>       Persisted state directory (default: ./mock_data)
 *   --log-dir <path>        Log directory (default: ./logs)
 *   --log-level <level>     Log level (default: info)
 *   --threads <n>           Worker threads (default: 4)
 *   --config <file>         JSON configuration file
 *   --help                  Show help message
 */

#include "server_config.hpp"

#include <osmock/integration/logger_adapter.hpp>
#include <osmock/storage/file_json_storage.hpp>
#include <osmock/storage/resource_store.hpp>
#include <osmock/web/rest_server.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace {

/// Set by the signal handler, polled by main()
std::atomic<bool> g_shutdown_requested{false};

/// Signal handler for graceful shutdown
void signal_handler(int /*signal*/) {
    g_shutdown_requested = true;
}

/// Install signal handlers
void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

}  // namespace

int main(int argc, char* argv[]) {
    using osmock::integration::logger_adapter;

    auto config = osmock::apps::osmock_server_config::parse_args(argc, argv);
    if (!config) {
        return 1;
    }

    osmock::integration::logger_config log_config;
    log_config.log_directory = config->logging.directory;
    log_config.min_level =
        osmock::integration::log_level_from_string(config->logging.level)
            .value_or(osmock::integration::log_level::info);
    logger_adapter::initialize(log_config);

    osmock::storage::file_json_storage_config storage_config;
    storage_config.directory = config->data_directory;
    auto storage =
        std::make_shared<osmock::storage::file_json_storage>(storage_config);
    auto store = std::make_shared<osmock::storage::resource_store>(storage);

    install_signal_handlers();

    osmock::web::rest_server server(config->rest);
    if (auto attached = server.set_store(store); attached.is_err()) {
        logger_adapter::error("Failed to attach store: {}",
                              attached.error().message);
        logger_adapter::shutdown();
        return 1;
    }

    logger_adapter::info("Starting osmock server on {}:{} (data: {})",
                         config->rest.bind_address, config->rest.port,
                         config->data_directory.string());
    server.start_async();

    while (!g_shutdown_requested && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    logger_adapter::info("Shutting down");
    server.stop();

    logger_adapter::shutdown();
    std::cout << "osmock server terminated\n";
    return 0;
}
