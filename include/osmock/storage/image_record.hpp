/**
 * @file image_record.hpp
 * @brief Image registry entity
 */

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>

namespace osmock::storage {

/**
 * @brief A registered disk image
 *
 * Images created through the API start and stay "queued"; seeded images
 * may report "active".
 */
struct image_record {
    std::string id;
    std::string name;
    std::string status{"queued"};
    std::int64_t size{0};
    std::string visibility{"private"};
    std::string container_format{"bare"};
    std::string disk_format{"qcow2"};

    /// UTC ISO 8601 creation time
    std::string created_at;

    auto operator==(const image_record&) const -> bool = default;
};

void to_json(nlohmann::json& j, const image_record& image);

/**
 * @brief Parse an image, defaulting optional fields stored documents may omit
 *        (visibility "public", container_format "bare", disk_format "qcow2")
 */
void from_json(const nlohmann::json& j, image_record& image);

} // namespace osmock::storage
