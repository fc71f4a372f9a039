/**
 * @file file_json_storage_test.cpp
 * @brief Unit tests for file_json_storage
 */

#include <osmock/storage/file_json_storage.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace osmock;
using namespace osmock::storage;

namespace {

/**
 * @brief RAII helper for creating temporary test directories
 */
class temp_directory {
public:
    temp_directory() {
        auto temp = std::filesystem::temp_directory_path();
        path_ = temp / ("osmock_test_" + std::to_string(
                            std::chrono::steady_clock::now()
                                .time_since_epoch()
                                .count()));
        std::filesystem::create_directories(path_);
    }

    ~temp_directory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

private:
    std::filesystem::path path_;
};

auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

auto make_storage(const std::filesystem::path& dir) -> file_json_storage {
    file_json_storage_config config;
    config.directory = dir;
    return file_json_storage(config);
}

}  // namespace

TEST_CASE("file_json_storage: construction creates the directory",
          "[storage][file_json_storage]") {
    temp_directory temp_dir;
    const auto data_dir = temp_dir.path() / "nested" / "mock_data";

    auto storage = make_storage(data_dir);

    REQUIRE(std::filesystem::is_directory(data_dir));
    REQUIRE(storage.path_for("images") == data_dir / "images.json");
}

TEST_CASE("file_json_storage: load falls back to the default",
          "[storage][file_json_storage]") {
    temp_directory temp_dir;
    auto storage = make_storage(temp_dir.path());
    const nlohmann::json fallback = {{"seed", true}};

    SECTION("missing file") {
        REQUIRE(storage.load("users", fallback) == fallback);
    }

    SECTION("corrupt file") {
        std::ofstream(storage.path_for("users")) << "{ not json";
        REQUIRE(storage.load("users", fallback) == fallback);
    }

    SECTION("empty file") {
        std::ofstream(storage.path_for("users")) << "";
        REQUIRE(storage.load("users", fallback) == fallback);
    }
}

TEST_CASE("file_json_storage: save then load returns the document",
          "[storage][file_json_storage]") {
    temp_directory temp_dir;
    auto storage = make_storage(temp_dir.path());

    const nlohmann::json doc = nlohmann::json::array(
        {{{"id", "v1"}, {"name", "data"}, {"size", 10}, {"status", "available"}}});

    auto saved = storage.save("volumes", doc);
    REQUIRE(saved.is_ok());
    REQUIRE(storage.load("volumes", nlohmann::json::array()) == doc);
}

TEST_CASE("file_json_storage: documents are written with two-space indent",
          "[storage][file_json_storage]") {
    temp_directory temp_dir;
    auto storage = make_storage(temp_dir.path());

    REQUIRE(storage.save("tokens", {{"abc", "user-1"}}).is_ok());

    REQUIRE(read_file(storage.path_for("tokens")) == "{\n  \"abc\": \"user-1\"\n}");
}

TEST_CASE("file_json_storage: save replaces the previous document",
          "[storage][file_json_storage]") {
    temp_directory temp_dir;
    auto storage = make_storage(temp_dir.path());

    REQUIRE(storage.save("tokens", {{"a", "user-1"}}).is_ok());
    REQUIRE(storage.save("tokens", nlohmann::json::object()).is_ok());

    REQUIRE(storage.load("tokens", {{"x", "y"}}) == nlohmann::json::object());

    // No temporary files are left behind
    std::size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(temp_dir.path())) {
        (void)entry;
        ++files;
    }
    REQUIRE(files == 1);
}

TEST_CASE("file_json_storage: save fails when the directory cannot be created",
          "[storage][file_json_storage]") {
    temp_directory temp_dir;
    const auto blocker = temp_dir.path() / "blocker";
    std::ofstream(blocker) << "a file, not a directory";

    file_json_storage_config config;
    config.directory = blocker / "data";
    file_json_storage storage(config);

    auto saved = storage.save("images", nlohmann::json::array());
    REQUIRE(saved.is_err());
    REQUIRE(saved.error().code == error_codes::storage_directory_error);
}
