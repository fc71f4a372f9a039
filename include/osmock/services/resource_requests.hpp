/**
 * @file resource_requests.hpp
 * @brief Create-request bodies for images, volumes and servers
 *
 * Each request type is parsed from a JSON body, validated, and turned into
 * a new record with a fresh id and the type's fixed initial status.
 */

#pragma once

#include <osmock/core/result.hpp>
#include <osmock/storage/image_record.hpp>
#include <osmock/storage/server_record.hpp>
#include <osmock/storage/volume_record.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace osmock::services {

/**
 * @brief POST /v2/images body
 */
struct image_create_request {
    std::string name;
    std::int64_t size{0};
    std::string visibility{"private"};
    std::string container_format{"bare"};
    std::string disk_format{"qcow2"};
};

/**
 * @brief POST /v3/volumes body
 */
struct volume_create_request {
    std::string name;
    std::int64_t size{0};
};

/**
 * @brief POST /v2.1/servers body
 */
struct server_create_request {
    std::string name;
    std::string image_id;
    std::optional<std::string> flavor_id;
};

/**
 * @brief Parse an image request
 *
 * "name" is required. Optional fields that are absent or null take their
 * defaults.
 *
 * @return The request, or error_codes::bad_request naming the offending
 *         field
 */
[[nodiscard]] auto parse_image_request(const nlohmann::json& body)
    -> Result<image_create_request>;

/**
 * @brief Parse a volume request; "name" and integer "size" are required
 */
[[nodiscard]] auto parse_volume_request(const nlohmann::json& body)
    -> Result<volume_create_request>;

/**
 * @brief Parse a server request; "name" and "image_id" are required
 */
[[nodiscard]] auto parse_server_request(const nlohmann::json& body)
    -> Result<server_create_request>;

/// New "queued" image stamped with the current time
[[nodiscard]] auto make_image(const image_create_request& request)
    -> storage::image_record;

/// New "available" volume
[[nodiscard]] auto make_volume(const volume_create_request& request)
    -> storage::volume_record;

/// New server in "BUILD" status
[[nodiscard]] auto make_server(const server_create_request& request)
    -> storage::server_record;

} // namespace osmock::services
