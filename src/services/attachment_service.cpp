/**
 * @file attachment_service.cpp
 * @brief Implementation of volume attachments
 */

#include <osmock/services/attachment_service.hpp>

#include <osmock/core/identifiers.hpp>
#include <osmock/integration/logger_adapter.hpp>
#include <osmock/storage/resource_store.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>

namespace osmock::services {

using integration::logger_adapter;
using storage::attachment_record;

namespace {

auto non_empty_string(const nlohmann::json& object, const char* key)
    -> std::optional<std::string> {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto parse_attach_request(const nlohmann::json& body) -> Result<attach_request> {
    if (!body.is_object()) {
        return osmock_error<attach_request>(error_codes::bad_request,
                                            "Request body must be a JSON object");
    }

    const nlohmann::json* fields = &body;
    auto wrapped = body.find("volumeAttachment");
    if (wrapped != body.end() && wrapped->is_object()) {
        fields = &*wrapped;
    }

    attach_request request;
    request.volume_id = non_empty_string(*fields, "volumeId");
    if (!request.volume_id) {
        request.volume_id = non_empty_string(*fields, "volume_id");
    }

    auto device = fields->find("device");
    if (device != fields->end() && device->is_string()) {
        request.device = device->get<std::string>();
    }

    return ok(std::move(request));
}

attachment_service::attachment_service(std::shared_ptr<storage::resource_store> store)
    : store_(std::move(store)) {}

auto attachment_service::attach(const std::string& server_id,
                                const attach_request& request)
    -> Result<attachment_record> {
    if (!request.volume_id) {
        return osmock_error<attachment_record>(error_codes::bad_request,
                                               "Missing volumeId");
    }
    const auto& volume_id = *request.volume_id;

    auto result = store_->mutate(
        [&](storage::store_state& state) -> Result<attachment_record> {
            auto duplicate = std::any_of(
                state.attachments.begin(), state.attachments.end(),
                [&](const attachment_record& a) {
                    return a.server_id == server_id && a.volume_id == volume_id;
                });
            if (duplicate) {
                return osmock_error<attachment_record>(error_codes::conflict,
                                                       "Already attached");
            }

            attachment_record attachment;
            attachment.id = core::generate_uuid();
            attachment.server_id = server_id;
            attachment.volume_id = volume_id;
            attachment.device =
                request.device.value_or(storage::default_attachment_device);
            attachment.attached_at = core::now_iso8601();

            state.attachments.push_back(attachment);
            return ok(std::move(attachment));
        });

    if (result.is_ok()) {
        logger_adapter::info("Attached volume {} to server {} as {}", volume_id,
                             server_id, result.value().device);
    }
    return result;
}

auto attachment_service::list(std::string_view server_id) const
    -> std::vector<attachment_record> {
    return store_->read([&](const storage::store_state& state) {
        std::vector<attachment_record> matches;
        std::copy_if(state.attachments.begin(), state.attachments.end(),
                     std::back_inserter(matches),
                     [&](const attachment_record& a) { return a.server_id == server_id; });
        return matches;
    });
}

auto attachment_service::detach(std::string_view server_id,
                                std::string_view attachment_id) -> VoidResult {
    auto result = store_->mutate([&](storage::store_state& state) -> VoidResult {
        auto it = std::find_if(state.attachments.begin(), state.attachments.end(),
                               [&](const attachment_record& a) {
                                   return a.server_id == server_id &&
                                          a.id == attachment_id;
                               });
        if (it == state.attachments.end()) {
            return osmock_void_error(error_codes::not_found, "Attachment not found");
        }
        state.attachments.erase(it);
        return ok();
    });

    if (result.is_ok()) {
        logger_adapter::info("Detached attachment {} from server {}",
                             attachment_id, server_id);
    }
    return result;
}

} // namespace osmock::services
