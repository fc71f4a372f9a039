/**
 * @file file_json_storage.cpp
 * @brief Implementation of the directory-backed persistence provider
 */

#include <osmock/storage/file_json_storage.hpp>

#include <osmock/integration/logger_adapter.hpp>

#include <fstream>
#include <random>

namespace osmock::storage {

using integration::logger_adapter;

namespace {

/// Generate a unique temporary filename next to @p base
auto generate_temp_filename(const std::filesystem::path& base)
    -> std::filesystem::path {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<uint64_t> dist;

    auto temp_name = base.filename().string() + ".tmp." +
                     std::to_string(dist(gen));
    return base.parent_path() / temp_name;
}

}  // namespace

file_json_storage::file_json_storage(file_json_storage_config config)
    : config_(std::move(config)) {
    if (config_.create_directories && !config_.directory.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config_.directory, ec);
        if (ec) {
            // save() reports the failure to the caller
            logger_adapter::warn("Unable to create data directory {}: {}",
                                 config_.directory.string(), ec.message());
        }
    }
}

auto file_json_storage::path_for(const std::string& name) const
    -> std::filesystem::path {
    return config_.directory / (name + ".json");
}

auto file_json_storage::load(const std::string& name,
                             const nlohmann::json& default_value) const
    -> nlohmann::json {
    const auto path = path_for(name);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        logger_adapter::info("No stored '{}' document, using defaults", name);
        return default_value;
    }

    std::ifstream file(path);
    if (!file) {
        logger_adapter::warn("Unable to open {}, using defaults", path.string());
        return default_value;
    }

    auto parsed = nlohmann::json::parse(file, nullptr, false);
    if (parsed.is_discarded()) {
        logger_adapter::warn("Corrupt document {}, using defaults", path.string());
        return default_value;
    }

    return parsed;
}

auto file_json_storage::save(const std::string& name,
                             const nlohmann::json& value) -> VoidResult {
    const auto path = path_for(name);

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return osmock_void_error(error_codes::storage_directory_error,
                                 "Unable to create data directory",
                                 path.parent_path().string() + ": " + ec.message());
    }

    const auto temp_path = generate_temp_filename(path);
    {
        std::ofstream file(temp_path, std::ios::trunc);
        file << value.dump(config_.indent, ' ', false,
                           nlohmann::json::error_handler_t::replace);
        file.flush();
        if (!file) {
            file.close();
            std::filesystem::remove(temp_path, ec);
            return osmock_void_error(error_codes::persistence_failed,
                                     "Failed to write document",
                                     temp_path.string());
        }
    }

    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        const auto message = ec.message();
        std::filesystem::remove(temp_path, ec);
        return osmock_void_error(error_codes::persistence_failed,
                                 "Failed to replace document",
                                 path.string() + ": " + message);
    }

    logger_adapter::trace("Saved {}", path.string());
    return ok();
}

} // namespace osmock::storage
