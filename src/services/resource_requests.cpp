/**
 * @file resource_requests.cpp
 * @brief Parsing and construction of image, volume and server records
 */

#include <osmock/services/resource_requests.hpp>

#include <osmock/core/identifiers.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

namespace osmock::services {

namespace {

/// True for JSON integers representable as std::int64_t
auto is_int64(const nlohmann::json& value) -> bool {
    if (!value.is_number_integer()) {
        return false;
    }
    return !value.is_number_unsigned() ||
           value.get<std::uint64_t>() <=
               static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
}

/**
 * @brief Field reader that remembers the first validation failure
 */
class field_reader {
public:
    explicit field_reader(const nlohmann::json& body) : body_(body) {}

    void required_string(const char* key, std::string& out) {
        auto it = find(key);
        if (it == nullptr || !it->is_string()) {
            fail(std::string("Field '") + key + "' must be a string");
            return;
        }
        out = it->get<std::string>();
    }

    void required_integer(const char* key, std::int64_t& out) {
        auto it = find(key);
        if (it == nullptr || !is_int64(*it)) {
            fail(std::string("Field '") + key + "' must be an integer");
            return;
        }
        out = it->get<std::int64_t>();
    }

    /// Leaves @p out untouched when the field is absent or null
    void optional_string(const char* key, std::string& out) {
        auto it = find(key);
        if (it == nullptr || it->is_null()) {
            return;
        }
        if (!it->is_string()) {
            fail(std::string("Field '") + key + "' must be a string");
            return;
        }
        out = it->get<std::string>();
    }

    void optional_string(const char* key, std::optional<std::string>& out) {
        std::string value;
        auto it = find(key);
        if (it == nullptr || it->is_null()) {
            out.reset();
            return;
        }
        optional_string(key, value);
        out = std::move(value);
    }

    void optional_integer(const char* key, std::int64_t& out) {
        auto it = find(key);
        if (it == nullptr || it->is_null()) {
            return;
        }
        if (!is_int64(*it)) {
            fail(std::string("Field '") + key + "' must be an integer");
            return;
        }
        out = it->get<std::int64_t>();
    }

    template <typename T>
    [[nodiscard]] auto finish(T value) -> Result<T> {
        if (!body_.is_object()) {
            return osmock_error<T>(error_codes::bad_request,
                                   "Request body must be a JSON object");
        }
        if (error_) {
            return osmock_error<T>(error_codes::bad_request, *error_);
        }
        return ok(std::move(value));
    }

private:
    [[nodiscard]] auto find(const char* key) const -> const nlohmann::json* {
        if (!body_.is_object()) {
            return nullptr;
        }
        auto it = body_.find(key);
        return it == body_.end() ? nullptr : &*it;
    }

    void fail(std::string message) {
        if (!error_) {
            error_ = std::move(message);
        }
    }

    const nlohmann::json& body_;
    std::optional<std::string> error_;
};

}  // namespace

auto parse_image_request(const nlohmann::json& body)
    -> Result<image_create_request> {
    image_create_request request;
    field_reader reader(body);
    reader.required_string("name", request.name);
    reader.optional_integer("size", request.size);
    reader.optional_string("visibility", request.visibility);
    reader.optional_string("container_format", request.container_format);
    reader.optional_string("disk_format", request.disk_format);
    return reader.finish(std::move(request));
}

auto parse_volume_request(const nlohmann::json& body)
    -> Result<volume_create_request> {
    volume_create_request request;
    field_reader reader(body);
    reader.required_string("name", request.name);
    reader.required_integer("size", request.size);
    return reader.finish(std::move(request));
}

auto parse_server_request(const nlohmann::json& body)
    -> Result<server_create_request> {
    server_create_request request;
    field_reader reader(body);
    reader.required_string("name", request.name);
    reader.required_string("image_id", request.image_id);
    reader.optional_string("flavor_id", request.flavor_id);
    return reader.finish(std::move(request));
}

auto make_image(const image_create_request& request) -> storage::image_record {
    storage::image_record image;
    image.id = core::generate_uuid();
    image.name = request.name;
    image.status = "queued";
    image.size = request.size;
    image.visibility = request.visibility;
    image.container_format = request.container_format;
    image.disk_format = request.disk_format;
    image.created_at = core::now_iso8601();
    return image;
}

auto make_volume(const volume_create_request& request) -> storage::volume_record {
    storage::volume_record volume;
    volume.id = core::generate_uuid();
    volume.name = request.name;
    volume.size = request.size;
    volume.status = "available";
    return volume;
}

auto make_server(const server_create_request& request) -> storage::server_record {
    storage::server_record server;
    server.id = core::generate_uuid();
    server.name = request.name;
    server.status = "BUILD";
    server.image_id = request.image_id;
    server.flavor_id = request.flavor_id;
    return server;
}

} // namespace osmock::services
