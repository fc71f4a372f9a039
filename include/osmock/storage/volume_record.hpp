/**
 * @file volume_record.hpp
 * @brief Block storage volume entity
 */

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>

namespace osmock::storage {

struct volume_record {
    std::string id;
    std::string name;

    /// Size in GiB
    std::int64_t size{0};

    /// Always "available"; volumes are never provisioned
    std::string status{"available"};

    auto operator==(const volume_record&) const -> bool = default;
};

void to_json(nlohmann::json& j, const volume_record& volume);
void from_json(const nlohmann::json& j, volume_record& volume);

} // namespace osmock::storage
