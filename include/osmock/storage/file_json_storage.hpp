/**
 * @file file_json_storage.hpp
 * @brief Directory-backed persistence provider
 *
 * Each named document lives in "<directory>/<name>.json", written
 * human-readable with a configurable indent.
 */

#pragma once

#include "json_storage_interface.hpp"

#include <filesystem>

namespace osmock::storage {

/**
 * @brief Configuration for file_json_storage
 */
struct file_json_storage_config {
    /// Directory holding the collection documents
    std::filesystem::path directory{"./mock_data"};

    /// Indentation used when writing documents (-1 = compact)
    int indent{2};

    /// Create the directory on construction if it does not exist
    bool create_directories{true};
};

/**
 * @brief JSON documents stored as files in one directory
 *
 * save() writes to a uniquely named temporary file beside the target and
 * renames it over the target, so a crash mid-write leaves the previous
 * document intact.
 */
class file_json_storage final : public json_storage_interface {
public:
    explicit file_json_storage(file_json_storage_config config);

    [[nodiscard]] auto load(const std::string& name,
                            const nlohmann::json& default_value) const
        -> nlohmann::json override;

    [[nodiscard]] auto save(const std::string& name,
                            const nlohmann::json& value) -> VoidResult override;

    /**
     * @brief Path of the file backing @p name
     */
    [[nodiscard]] auto path_for(const std::string& name) const
        -> std::filesystem::path;

    [[nodiscard]] auto config() const noexcept -> const file_json_storage_config& {
        return config_;
    }

private:
    file_json_storage_config config_;
};

} // namespace osmock::storage
