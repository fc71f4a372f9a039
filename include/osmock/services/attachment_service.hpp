/**
 * @file attachment_service.hpp
 * @brief Volume attachments on servers
 */

#pragma once

#include <osmock/core/result.hpp>
#include <osmock/storage/attachment_record.hpp>

#include <nlohmann/json_fwd.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace osmock::storage {
class resource_store;
} // namespace osmock::storage

namespace osmock::services {

/**
 * @brief POST /v2.1/servers/{id}/os-volume_attachments body
 */
struct attach_request {
    /// From "volumeId", or its alias "volume_id"; empty strings count as absent
    std::optional<std::string> volume_id;

    /// From "device"; absent or null means the default device
    std::optional<std::string> device;
};

/**
 * @brief Read an attach request body
 *
 * Accepts either {"volumeAttachment": {...}} or the bare inner object.
 * Missing fields are left unset; only attach() decides whether the request
 * is acceptable.
 *
 * @return The request, or error_codes::bad_request if the body is not a
 *         JSON object
 */
[[nodiscard]] auto parse_attach_request(const nlohmann::json& body)
    -> Result<attach_request>;

/**
 * @class attachment_service
 * @brief Links volumes to servers, one attachment per (server, volume) pair
 *
 * Server and volume ids are not checked against their collections, so a
 * volume can be attached to a server that does not exist. The same volume
 * may be attached to several different servers.
 */
class attachment_service {
public:
    explicit attachment_service(std::shared_ptr<storage::resource_store> store);

    /**
     * @brief Attach a volume to @p server_id and flush
     *
     * @return The new attachment; error_codes::bad_request when the request
     *         has no volume id; error_codes::conflict when the pair is
     *         already attached
     */
    [[nodiscard]] auto attach(const std::string& server_id,
                              const attach_request& request)
        -> Result<storage::attachment_record>;

    /**
     * @brief Attachments of @p server_id in insertion order
     */
    [[nodiscard]] auto list(std::string_view server_id) const
        -> std::vector<storage::attachment_record>;

    /**
     * @brief Remove the attachment matching both ids and flush
     * @return error_codes::not_found when nothing matched
     */
    [[nodiscard]] auto detach(std::string_view server_id,
                              std::string_view attachment_id) -> VoidResult;

private:
    std::shared_ptr<storage::resource_store> store_;
};

} // namespace osmock::services
