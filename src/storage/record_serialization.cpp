/**
 * @file record_serialization.cpp
 * @brief JSON mapping of the persisted entity records
 *
 * The document shapes match what earlier releases wrote to disk, so data
 * directories carry over between versions.
 */

#include <osmock/storage/attachment_record.hpp>
#include <osmock/storage/image_record.hpp>
#include <osmock/storage/server_record.hpp>
#include <osmock/storage/user_record.hpp>
#include <osmock/storage/volume_record.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace osmock::storage {

namespace {

auto optional_string(const nlohmann::json& j, const char* key)
    -> std::optional<std::string> {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

/// Throws std::out_of_range for unsigned values beyond std::int64_t
auto stored_size(const nlohmann::json& value) -> std::int64_t {
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw std::out_of_range("size exceeds the signed 64-bit range");
    }
    return value.get<std::int64_t>();
}

auto nullable(const std::optional<std::string>& value) -> nlohmann::json {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

// ============================================================================
// Users
// ============================================================================

auto users_to_json(const user_map& users) -> nlohmann::json {
    auto doc = nlohmann::json::object();
    for (const auto& [username, user] : users) {
        doc[username] = {{"password", user.password},
                         {"id", user.id},
                         {"role", user.role},
                         {"domain", user.domain}};
    }
    return doc;
}

auto users_from_json(const nlohmann::json& doc) -> user_map {
    user_map users;
    for (const auto& [username, entry] : doc.get_ref<const nlohmann::json::object_t&>()) {
        user_record user;
        user.username = username;
        entry.at("password").get_to(user.password);
        entry.at("id").get_to(user.id);
        user.role = entry.value("role", std::string{"user"});
        user.domain = entry.value("domain", std::string{"default"});
        users.emplace(username, std::move(user));
    }
    return users;
}

// ============================================================================
// Images
// ============================================================================

void to_json(nlohmann::json& j, const image_record& image) {
    j = {{"id", image.id},
         {"name", image.name},
         {"status", image.status},
         {"size", image.size},
         {"visibility", image.visibility},
         {"container_format", image.container_format},
         {"disk_format", image.disk_format},
         {"created_at", image.created_at}};
}

void from_json(const nlohmann::json& j, image_record& image) {
    j.at("id").get_to(image.id);
    j.at("name").get_to(image.name);
    j.at("status").get_to(image.status);
    image.size = j.at("size").is_null() ? 0 : stored_size(j.at("size"));
    image.visibility = j.value("visibility", std::string{"public"});
    image.container_format = j.value("container_format", std::string{"bare"});
    image.disk_format = j.value("disk_format", std::string{"qcow2"});
    image.created_at = j.value("created_at", std::string{});
}

// ============================================================================
// Volumes
// ============================================================================

void to_json(nlohmann::json& j, const volume_record& volume) {
    j = {{"id", volume.id},
         {"name", volume.name},
         {"size", volume.size},
         {"status", volume.status}};
}

void from_json(const nlohmann::json& j, volume_record& volume) {
    j.at("id").get_to(volume.id);
    j.at("name").get_to(volume.name);
    volume.size = stored_size(j.at("size"));
    volume.status = j.value("status", std::string{"available"});
}

// ============================================================================
// Servers
// ============================================================================

void to_json(nlohmann::json& j, const server_record& server) {
    j = {{"id", server.id},
         {"name", server.name},
         {"status", server.status},
         {"image_id", nullable(server.image_id)},
         {"flavor_id", nullable(server.flavor_id)}};
}

void from_json(const nlohmann::json& j, server_record& server) {
    j.at("id").get_to(server.id);
    j.at("name").get_to(server.name);
    j.at("status").get_to(server.status);
    server.image_id = optional_string(j, "image_id");
    server.flavor_id = optional_string(j, "flavor_id");
}

// ============================================================================
// Attachments
// ============================================================================

void to_json(nlohmann::json& j, const attachment_record& attachment) {
    j = {{"id", attachment.id},
         {"serverId", attachment.server_id},
         {"volumeId", attachment.volume_id},
         {"device", attachment.device},
         {"attached_at", attachment.attached_at}};
}

void from_json(const nlohmann::json& j, attachment_record& attachment) {
    j.at("id").get_to(attachment.id);
    j.at("serverId").get_to(attachment.server_id);
    j.at("volumeId").get_to(attachment.volume_id);
    attachment.device = j.value("device", std::string{default_attachment_device});
    attachment.attached_at = j.value("attached_at", std::string{});
}

} // namespace osmock::storage
