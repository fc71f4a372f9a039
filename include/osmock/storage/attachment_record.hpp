/**
 * @file attachment_record.hpp
 * @brief Server/volume attachment relationship
 */

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace osmock::storage {

/// Device path used when an attach request names none
inline constexpr const char* default_attachment_device = "/dev/vdb";

/**
 * @brief Links one server to one volume
 *
 * At most one attachment exists per (server_id, volume_id) pair. The ids
 * are not checked against the server and volume collections.
 * Serialized with the camelCase keys "serverId" and "volumeId".
 */
struct attachment_record {
    std::string id;
    std::string server_id;
    std::string volume_id;
    std::string device{default_attachment_device};

    /// UTC ISO 8601 attach time
    std::string attached_at;

    auto operator==(const attachment_record&) const -> bool = default;
};

void to_json(nlohmann::json& j, const attachment_record& attachment);
void from_json(const nlohmann::json& j, attachment_record& attachment);

} // namespace osmock::storage
