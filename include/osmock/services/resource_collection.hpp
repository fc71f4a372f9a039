/**
 * @file resource_collection.hpp
 * @brief Generic list/create/get/delete over one store collection
 *
 * This file provides the resource_collection template shared by the
 * image, volume and server APIs.
 */

#pragma once

#include <osmock/core/result.hpp>
#include <osmock/storage/resource_store.hpp>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace osmock::services {

/**
 * @brief CRUD operations over a sequence collection of the resource store
 *
 * Entities are created or deleted, never updated. Lookups are linear scans
 * by id; ids are unique, so delete removes at most one entity. Every
 * successful mutation is flushed before it returns.
 *
 * Credentials are checked by the caller before any operation.
 *
 * @tparam Record Entity type with a std::string `id` member
 *
 * @code
 * volume_collection volumes(store, &store_state::volumes, "Volume");
 * auto created = volumes.create(make_volume(request));
 * auto fetched = volumes.get(created.value().id);
 * @endcode
 */
template <typename Record>
class resource_collection {
public:
    using record_type = Record;
    using member_type = std::vector<Record> storage::store_state::*;

    /**
     * @param store Owning resource store
     * @param member The store_state member holding this collection
     * @param entity_name Name used in not-found messages, e.g. "Image"
     */
    resource_collection(std::shared_ptr<storage::resource_store> store,
                        member_type member, std::string entity_name)
        : store_(std::move(store))
        , member_(member)
        , entity_name_(std::move(entity_name)) {}

    /**
     * @brief All entities in insertion order
     */
    [[nodiscard]] auto list() const -> std::vector<Record> {
        return store_->read(
            [this](const storage::store_state& state) { return state.*member_; });
    }

    /**
     * @brief Append @p record and flush
     * @return The stored entity
     */
    [[nodiscard]] auto create(Record record) -> Result<Record> {
        return store_->mutate([&](storage::store_state& state) -> Result<Record> {
            (state.*member_).push_back(record);
            return ok(record);
        });
    }

    /**
     * @brief Entity with the given id, or error_codes::not_found
     */
    [[nodiscard]] auto get(std::string_view id) const -> Result<Record> {
        auto found = store_->read(
            [&](const storage::store_state& state) -> std::optional<Record> {
                const auto& records = state.*member_;
                auto it = std::find_if(records.begin(), records.end(),
                                       [&](const Record& r) { return r.id == id; });
                if (it == records.end()) {
                    return std::nullopt;
                }
                return *it;
            });

        if (!found) {
            return osmock_error<Record>(error_codes::not_found, not_found_message());
        }
        return ok(std::move(*found));
    }

    /**
     * @brief Remove the entity with the given id and flush
     * @return error_codes::not_found if no entity matched; nothing is
     *         written in that case
     */
    [[nodiscard]] auto remove(std::string_view id) -> VoidResult {
        return store_->mutate([&](storage::store_state& state) -> VoidResult {
            auto& records = state.*member_;
            auto it = std::find_if(records.begin(), records.end(),
                                   [&](const Record& r) { return r.id == id; });
            if (it == records.end()) {
                return osmock_void_error(error_codes::not_found, not_found_message());
            }
            records.erase(it);
            return ok();
        });
    }

    [[nodiscard]] auto entity_name() const noexcept -> const std::string& {
        return entity_name_;
    }

private:
    [[nodiscard]] auto not_found_message() const -> std::string {
        return entity_name_ + " not found";
    }

    std::shared_ptr<storage::resource_store> store_;
    member_type member_;
    std::string entity_name_;
};

using image_collection = resource_collection<storage::image_record>;
using volume_collection = resource_collection<storage::volume_record>;
using server_collection = resource_collection<storage::server_record>;

} // namespace osmock::services
