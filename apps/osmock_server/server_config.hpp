/**
 * @file server_config.hpp
 * @brief Configuration management for the osmock server
 *
 * Values come from defaults, then an optional JSON file named with
 * --config, then the remaining command-line options.
 */

#ifndef OSMOCK_APPS_SERVER_CONFIG_HPP
#define OSMOCK_APPS_SERVER_CONFIG_HPP

#include <osmock/core/result.hpp>
#include <osmock/web/rest_config.hpp>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace osmock::apps {

/**
 * @brief Logging configuration
 */
struct logging_config {
    /// Log level: "trace", "debug", "info", "warn", "error", "fatal"
    std::string level{"info"};

    /// Directory for osmock.log and audit.json
    std::filesystem::path directory{"./logs"};
};

/**
 * @brief Complete osmock server configuration
 */
struct osmock_server_config {
    /// Listener settings
    web::rest_server_config rest;

    /// Directory holding the persisted collections
    std::filesystem::path data_directory{"./mock_data"};

    /// Logging settings
    logging_config logging;

    /**
     * @brief Parse configuration from command line arguments
     *
     * Supported options:
     *   --port <port>           Port to listen on (default: 8000)
     *   --bind <address>        Bind address (default: 0.0.0.0)
     *   --data-dir <path>       Persisted state directory (default: ./mock_data)
     *   --log-dir <path>        Log directory (default: ./logs)
     *   --log-level <level>     Log level (default: info)
     *   --threads <n>           Worker threads (default: 4)
     *   --config <file>         JSON configuration file
     *   --help                  Show help message
     *
     * @return Configuration or nullopt if --help was requested or error
     */
    static auto parse_args(int argc, char* argv[])
        -> std::optional<osmock_server_config>;

    /**
     * @brief Apply the keys of a JSON configuration document
     *
     * Recognized keys: port, bind_address, data_dir, log_dir, log_level,
     * threads. Unknown keys are ignored.
     *
     * @return error_codes::invalid_configuration naming the first bad key
     */
    auto apply_json(const nlohmann::json& doc) -> VoidResult;

    /**
     * @brief Read @p path and apply it with apply_json()
     */
    auto apply_file(const std::filesystem::path& path) -> VoidResult;

    /**
     * @brief Print help message to stdout
     */
    static void print_help();
};

}  // namespace osmock::apps

#endif  // OSMOCK_APPS_SERVER_CONFIG_HPP
