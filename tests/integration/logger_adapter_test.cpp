/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter levels and the audit trail
 */

#include <osmock/integration/logger_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace osmock::integration;

namespace {

auto unique_log_dir() -> std::filesystem::path {
    return std::filesystem::temp_directory_path() /
           ("osmock_log_test_" + std::to_string(
               std::chrono::steady_clock::now().time_since_epoch().count()));
}

auto read_lines(const std::filesystem::path& path) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::ifstream file(path);
    for (std::string line; std::getline(file, line);) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

TEST_CASE("log_level_from_string", "[integration][logger]") {
    REQUIRE(log_level_from_string("trace") == log_level::trace);
    REQUIRE(log_level_from_string("info") == log_level::info);
    REQUIRE(log_level_from_string("warning") == log_level::warn);
    REQUIRE(log_level_from_string("critical") == log_level::fatal);
    REQUIRE_FALSE(log_level_from_string("verbose").has_value());
}

TEST_CASE("logger_adapter: calls before initialize are ignored", "[integration][logger]") {
    REQUIRE_FALSE(logger_adapter::is_initialized());
    logger_adapter::info("not initialized {}", 1);
    logger_adapter::log_security_event(security_event_type::token_rejected, "ignored");
}

TEST_CASE("logger_adapter: security events go to audit.json", "[integration][logger]") {
    const auto dir = unique_log_dir();

    logger_config config;
    config.log_directory = dir;
    config.enable_console = false;
    config.async_mode = false;
    config.min_level = log_level::debug;
    logger_adapter::initialize(config);
    REQUIRE(logger_adapter::is_initialized());

    logger_adapter::log_security_event(security_event_type::authentication_success,
                                       "Token issued for admin", "user-1");
    logger_adapter::log_security_event(security_event_type::token_revoked,
                                       "Token revoked");
    logger_adapter::shutdown();

    auto lines = read_lines(dir / "audit.json");
    REQUIRE(lines.size() == 2);

    auto first = nlohmann::json::parse(lines[0]);
    REQUIRE(first["event_type"] == "AUTHENTICATION_SUCCESS");
    REQUIRE(first["description"] == "Token issued for admin");
    REQUIRE(first["subject"] == "user-1");
    REQUIRE(first.contains("timestamp"));

    auto second = nlohmann::json::parse(lines[1]);
    REQUIRE(second["event_type"] == "TOKEN_REVOKED");
    REQUIRE_FALSE(second.contains("subject"));

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST_CASE("logger_adapter: level filter", "[integration][logger]") {
    logger_adapter::set_min_level(log_level::warn);
    REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
    REQUIRE(logger_adapter::is_level_enabled(log_level::error));
    REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::off));
    logger_adapter::set_min_level(log_level::info);
}
