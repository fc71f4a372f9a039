/**
 * @file server_record.hpp
 * @brief Compute server entity
 */

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>

namespace osmock::storage {

/**
 * @brief A compute server
 *
 * Servers created through the API report "BUILD" forever; seeded servers
 * may report "ACTIVE". image_id and flavor_id serialize as null when unset.
 */
struct server_record {
    std::string id;
    std::string name;
    std::string status{"BUILD"};
    std::optional<std::string> image_id;
    std::optional<std::string> flavor_id;

    auto operator==(const server_record&) const -> bool = default;
};

void to_json(nlohmann::json& j, const server_record& server);
void from_json(const nlohmann::json& j, server_record& server);

} // namespace osmock::storage
