/**
 * @file resource_store.cpp
 * @brief Implementation of the persisted resource store
 */

#include <osmock/storage/resource_store.hpp>

#include <osmock/core/identifiers.hpp>
#include <osmock/integration/logger_adapter.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace osmock::storage {

using integration::logger_adapter;

namespace {

/**
 * @brief Load one collection, falling back to @p seed on any parse problem
 */
template <typename T, typename ToJson, typename FromJson>
auto load_collection(const json_storage_interface& storage, const char* name,
                     T seed, ToJson to_doc, FromJson from_doc) -> T {
    const auto doc = storage.load(name, to_doc(seed));
    try {
        return from_doc(doc);
    } catch (const nlohmann::json::exception& e) {
        logger_adapter::warn("Stored '{}' document is malformed ({}), using defaults",
                             name, e.what());
        return seed;
    } catch (const std::out_of_range& e) {
        logger_adapter::warn("Stored '{}' document is out of range ({}), using defaults",
                             name, e.what());
        return seed;
    }
}

template <typename Record>
auto sequence_to_json(const std::vector<Record>& records) -> nlohmann::json {
    auto doc = nlohmann::json::array();
    for (const auto& record : records) {
        doc.push_back(record);
    }
    return doc;
}

/// Throws nlohmann::json::type_error unless @p doc is an array of records
template <typename Record>
auto sequence_from_json(const nlohmann::json& doc) -> std::vector<Record> {
    return doc.get<std::vector<Record>>();
}

/// Throws nlohmann::json::type_error unless @p doc is an object of strings
auto tokens_from_json(const nlohmann::json& doc) -> token_map {
    return doc.get<token_map>();
}

}  // namespace

auto make_seed_state() -> store_state {
    store_state seed;

    seed.users.emplace("admin", user_record{"admin", "secret", "user-1", "admin", "default"});
    seed.users.emplace("demo", user_record{"demo", "test", "user-2", "user", "default"});

    image_record image;
    image.id = core::generate_uuid();
    image.name = "Cirros";
    image.status = "active";
    image.size = 13287936;
    image.visibility = "public";
    image.container_format = "bare";
    image.disk_format = "qcow2";
    image.created_at = core::now_iso8601();
    seed.images.push_back(std::move(image));

    volume_record volume;
    volume.id = core::generate_uuid();
    volume.name = "vol-1";
    volume.size = 1;
    seed.volumes.push_back(std::move(volume));

    server_record server;
    server.id = core::generate_uuid();
    server.name = "server-1";
    server.status = "ACTIVE";
    seed.servers.push_back(std::move(server));

    return seed;
}

resource_store::resource_store(std::shared_ptr<json_storage_interface> storage)
    : storage_(std::move(storage)) {
    std::unique_lock lock(mutex_);
    load_locked();
}

void resource_store::load_locked() {
    auto seed = make_seed_state();
    const auto& storage = *storage_;

    state_.users = load_collection(storage, collection_names::users,
                                   std::move(seed.users), users_to_json,
                                   users_from_json);
    state_.tokens = load_collection(
        storage, collection_names::tokens, std::move(seed.tokens),
        [](const token_map& t) { return nlohmann::json(t); }, tokens_from_json);
    state_.images = load_collection(storage, collection_names::images,
                                    std::move(seed.images),
                                    sequence_to_json<image_record>,
                                    sequence_from_json<image_record>);
    state_.volumes = load_collection(storage, collection_names::volumes,
                                     std::move(seed.volumes),
                                     sequence_to_json<volume_record>,
                                     sequence_from_json<volume_record>);
    state_.servers = load_collection(storage, collection_names::servers,
                                     std::move(seed.servers),
                                     sequence_to_json<server_record>,
                                     sequence_from_json<server_record>);
    state_.attachments = load_collection(storage, collection_names::attachments,
                                         std::move(seed.attachments),
                                         sequence_to_json<attachment_record>,
                                         sequence_from_json<attachment_record>);

    logger_adapter::info(
        "Loaded state: {} users, {} tokens, {} images, {} volumes, {} servers, "
        "{} attachments",
        state_.users.size(), state_.tokens.size(), state_.images.size(),
        state_.volumes.size(), state_.servers.size(), state_.attachments.size());
}

auto resource_store::flush() -> VoidResult {
    std::unique_lock lock(mutex_);
    return flush_locked();
}

auto resource_store::snapshot() const -> store_state {
    std::shared_lock lock(mutex_);
    return state_;
}

auto resource_store::flush_locked() -> VoidResult {
    const std::pair<const char*, nlohmann::json> documents[] = {
        {collection_names::users, users_to_json(state_.users)},
        {collection_names::tokens, nlohmann::json(state_.tokens)},
        {collection_names::images, sequence_to_json(state_.images)},
        {collection_names::volumes, sequence_to_json(state_.volumes)},
        {collection_names::servers, sequence_to_json(state_.servers)},
        {collection_names::attachments, sequence_to_json(state_.attachments)},
    };

    for (const auto& [name, doc] : documents) {
        auto saved = storage_->save(name, doc);
        if (saved.is_err()) {
            logger_adapter::error("Failed to persist '{}': {}", name,
                                  saved.error().message);
            return osmock_void_error(error_codes::persistence_failed,
                                     "Failed to persist state",
                                     std::string(name) + ": " + saved.error().message);
        }
    }

    logger_adapter::debug("Flushed all collections");
    return ok();
}

void resource_store::restore_locked(store_state backup) {
    state_ = std::move(backup);

    auto rewritten = flush_locked();
    if (rewritten.is_err()) {
        logger_adapter::warn("Stored documents may not match the restored state: {}",
                             rewritten.error().message);
    }
}

} // namespace osmock::storage
