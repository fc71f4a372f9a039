/**
 * @file server_config_test.cpp
 * @brief Unit tests for osmock_server option and file parsing
 */

#include "server_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace osmock;
using osmock::apps::osmock_server_config;

namespace {

/// argv built from string literals, program name included
class arg_list {
public:
    arg_list(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "osmock_server");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    [[nodiscard]] auto argc() const -> int { return static_cast<int>(pointers_.size()); }
    [[nodiscard]] auto argv() -> char** { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

auto parse(arg_list args) -> std::optional<osmock_server_config> {
    return osmock_server_config::parse_args(args.argc(), args.argv());
}

auto write_config_file(const nlohmann::json& doc) -> std::filesystem::path {
    auto path = std::filesystem::temp_directory_path() /
                ("osmock_config_" + std::to_string(
                    std::chrono::steady_clock::now().time_since_epoch().count()) +
                 ".json");
    std::ofstream(path) << doc.dump();
    return path;
}

}  // namespace

TEST_CASE("parse_args: defaults", "[config]") {
    auto config = parse({});

    REQUIRE(config.has_value());
    REQUIRE(config->rest.port == 8000);
    REQUIRE(config->rest.bind_address == "0.0.0.0");
    REQUIRE(config->data_directory == "./mock_data");
    REQUIRE(config->logging.directory == "./logs");
    REQUIRE(config->logging.level == "info");
}

TEST_CASE("parse_args: options", "[config]") {
    auto config = parse({"--port", "9000", "--bind", "127.0.0.1", "--data-dir",
                         "/tmp/osmock", "--log-dir", "/tmp/osmock-logs",
                         "--log-level", "debug", "--threads", "2"});

    REQUIRE(config.has_value());
    REQUIRE(config->rest.port == 9000);
    REQUIRE(config->rest.bind_address == "127.0.0.1");
    REQUIRE(config->data_directory == "/tmp/osmock");
    REQUIRE(config->logging.directory == "/tmp/osmock-logs");
    REQUIRE(config->logging.level == "debug");
    REQUIRE(config->rest.concurrency == 2);
}

TEST_CASE("parse_args: invalid input", "[config]") {
    REQUIRE_FALSE(parse({"--port"}).has_value());
    REQUIRE_FALSE(parse({"--port", "0"}).has_value());
    REQUIRE_FALSE(parse({"--port", "70000"}).has_value());
    REQUIRE_FALSE(parse({"--port", "http"}).has_value());
    REQUIRE_FALSE(parse({"--log-level", "loud"}).has_value());
    REQUIRE_FALSE(parse({"--threads", "0"}).has_value());
    REQUIRE_FALSE(parse({"--threads", "65537"}).has_value());
    REQUIRE_FALSE(parse({"--threads", "257"}).has_value());
    REQUIRE(parse({"--threads", "256"}).has_value());
    REQUIRE_FALSE(parse({"--unknown"}).has_value());
    REQUIRE_FALSE(parse({"--help"}).has_value());
}

TEST_CASE("parse_args: command line overrides the config file", "[config]") {
    const auto path = write_config_file({{"port", 7000},
                                         {"bind_address", "10.0.0.1"},
                                         {"data_dir", "/srv/osmock"},
                                         {"log_level", "warn"}});

    auto config = parse({"--port", "7100", "--config", path.string()});
    std::filesystem::remove(path);

    REQUIRE(config.has_value());
    REQUIRE(config->rest.port == 7100);
    REQUIRE(config->rest.bind_address == "10.0.0.1");
    REQUIRE(config->data_directory == "/srv/osmock");
    REQUIRE(config->logging.level == "warn");
}

TEST_CASE("parse_args: unreadable config file", "[config]") {
    REQUIRE_FALSE(parse({"--config", "/nonexistent/osmock.json"}).has_value());
}

TEST_CASE("apply_json: invalid values", "[config]") {
    osmock_server_config config;

    SECTION("port out of range") {
        auto result = config.apply_json({{"port", 0}});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == error_codes::invalid_configuration);
    }

    SECTION("port as string") {
        REQUIRE(config.apply_json({{"port", "8000"}}).is_err());
    }

    SECTION("too many threads") {
        auto result = config.apply_json({{"threads", 65537}});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == error_codes::invalid_configuration);
        REQUIRE(config.rest.concurrency == 4);
    }

    SECTION("unknown level") {
        REQUIRE(config.apply_json({{"log_level", "chatty"}}).is_err());
    }

    SECTION("not an object") {
        REQUIRE(config.apply_json(nlohmann::json::array()).is_err());
    }

    REQUIRE(config.rest.port == 8000);
}

TEST_CASE("apply_json: unknown keys are ignored", "[config]") {
    osmock_server_config config;

    auto result = config.apply_json({{"threads", 8}, {"colour", "blue"}});

    REQUIRE(result.is_ok());
    REQUIRE(config.rest.concurrency == 8);
}
