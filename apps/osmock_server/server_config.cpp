/**
 * @file server_config.cpp
 * @brief Implementation of osmock server configuration parsing
 */

#include "server_config.hpp"

#include <osmock/integration/logger_adapter.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <limits>
#include <string_view>

namespace osmock::apps {

namespace {

auto parse_port(std::string_view text) -> std::optional<std::uint16_t> {
    try {
        const auto value = std::stol(std::string(text));
        if (value < 1 || value > std::numeric_limits<std::uint16_t>::max()) {
            return std::nullopt;
        }
        return static_cast<std::uint16_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

auto parse_threads(std::string_view text) -> std::optional<std::size_t> {
    try {
        const auto value = std::stol(std::string(text));
        if (value < 1 || static_cast<unsigned long>(value) > web::max_concurrency) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

auto valid_level(std::string_view level) -> bool {
    return integration::log_level_from_string(level).has_value();
}

auto invalid_key(const char* key) -> VoidResult {
    return osmock_void_error(error_codes::invalid_configuration,
                             std::string("Invalid value for '") + key + "'");
}

}  // namespace

void osmock_server_config::print_help() {
    std::cout << R"(
OpenStack Mock Server

Usage: osmock_server [OPTIONS]

Options:
  --port <port>           Port to listen on (default: 8000)
  --bind <address>        Address to bind to (default: 0.0.0.0)
  --data-dir <path>       Directory for persisted state (default: ./mock_data)
  --log-dir <path>        Directory for logs and audit trail (default: ./logs)
  --log-level <level>     Log level: trace, debug, info, warn, error, fatal
                          (default: info)
  --threads <n>           Worker threads, 1-256 (default: 4)
  --config <file>         JSON configuration file; command-line options
                          override its values
  --help, -h              Show this help message

Examples:
  osmock_server --port 9000 --data-dir /var/lib/osmock
  osmock_server --config osmock.json --log-level debug
)";
}

auto osmock_server_config::apply_json(const nlohmann::json& doc) -> VoidResult {
    if (!doc.is_object()) {
        return osmock_void_error(error_codes::invalid_configuration,
                                 "Configuration must be a JSON object");
    }

    if (auto it = doc.find("port"); it != doc.end()) {
        if (!it->is_number_integer()) {
            return invalid_key("port");
        }
        const auto port = it->get<std::int64_t>();
        if (port < 1 || port > std::numeric_limits<std::uint16_t>::max()) {
            return invalid_key("port");
        }
        rest.port = static_cast<std::uint16_t>(port);
    }

    if (auto it = doc.find("bind_address"); it != doc.end()) {
        if (!it->is_string()) {
            return invalid_key("bind_address");
        }
        rest.bind_address = it->get<std::string>();
    }

    if (auto it = doc.find("data_dir"); it != doc.end()) {
        if (!it->is_string()) {
            return invalid_key("data_dir");
        }
        data_directory = it->get<std::string>();
    }

    if (auto it = doc.find("log_dir"); it != doc.end()) {
        if (!it->is_string()) {
            return invalid_key("log_dir");
        }
        logging.directory = it->get<std::string>();
    }

    if (auto it = doc.find("log_level"); it != doc.end()) {
        if (!it->is_string() || !valid_level(it->get<std::string>())) {
            return invalid_key("log_level");
        }
        logging.level = it->get<std::string>();
    }

    if (auto it = doc.find("threads"); it != doc.end()) {
        if (!it->is_number_integer() || it->get<std::int64_t>() < 1 ||
            it->get<std::int64_t>() > static_cast<std::int64_t>(web::max_concurrency)) {
            return invalid_key("threads");
        }
        rest.concurrency = it->get<std::size_t>();
    }

    return ok();
}

auto osmock_server_config::apply_file(const std::filesystem::path& path)
    -> VoidResult {
    std::ifstream file(path);
    if (!file) {
        return osmock_void_error(error_codes::invalid_configuration,
                                 "Cannot open configuration file " + path.string());
    }

    auto doc = nlohmann::json::parse(file, nullptr, false);
    if (doc.is_discarded()) {
        return osmock_void_error(error_codes::invalid_configuration,
                                 "Configuration file is not valid JSON: " +
                                     path.string());
    }
    return apply_json(doc);
}

auto osmock_server_config::parse_args(int argc, char* argv[])
    -> std::optional<osmock_server_config> {

    osmock_server_config config;

    // The file is applied first so that every other option overrides it
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        }
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires a value\n";
                return std::nullopt;
            }
            auto applied = config.apply_file(argv[i + 1]);
            if (applied.is_err()) {
                std::cerr << "Error: " << applied.error().message << "\n";
                return std::nullopt;
            }
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--config") {
            ++i;
            continue;
        }

        if (arg == "--port" || arg == "--bind" || arg == "--data-dir" ||
            arg == "--log-dir" || arg == "--log-level" || arg == "--threads") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return std::nullopt;
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return std::nullopt;
        }

        const std::string_view value = argv[++i];

        if (arg == "--port") {
            auto port = parse_port(value);
            if (!port) {
                std::cerr << "Error: Invalid port number\n";
                return std::nullopt;
            }
            config.rest.port = *port;
        } else if (arg == "--bind") {
            config.rest.bind_address = std::string(value);
        } else if (arg == "--data-dir") {
            config.data_directory = std::string(value);
        } else if (arg == "--log-dir") {
            config.logging.directory = std::string(value);
        } else if (arg == "--log-level") {
            if (!valid_level(value)) {
                std::cerr << "Error: Invalid log level: " << value << "\n";
                std::cerr << "Valid levels: trace, debug, info, warn, error, fatal\n";
                return std::nullopt;
            }
            config.logging.level = std::string(value);
        } else if (arg == "--threads") {
            auto threads = parse_threads(value);
            if (!threads) {
                std::cerr << "Error: Invalid thread count\n";
                return std::nullopt;
            }
            config.rest.concurrency = *threads;
        }
    }

    return config;
}

}  // namespace osmock::apps
