/**
 * @file resource_store.hpp
 * @brief In-memory collections persisted after every mutation
 *
 * This file provides the resource_store class, the single owner of all
 * service state: users, bearer tokens, images, volumes, servers and
 * volume attachments.
 */

#pragma once

#include "attachment_record.hpp"
#include "image_record.hpp"
#include "json_storage_interface.hpp"
#include "server_record.hpp"
#include "user_record.hpp"
#include "volume_record.hpp"

#include <osmock/core/result.hpp>

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace osmock::storage {

/// Persisted document names, one per collection
namespace collection_names {
inline constexpr const char* users = "users";
inline constexpr const char* tokens = "tokens";
inline constexpr const char* images = "images";
inline constexpr const char* volumes = "volumes";
inline constexpr const char* servers = "servers";
inline constexpr const char* attachments = "attachments";
} // namespace collection_names

/**
 * @brief Complete service state
 *
 * Sequence collections keep insertion order.
 */
struct store_state {
    user_map users;
    token_map tokens;
    std::vector<image_record> images;
    std::vector<volume_record> volumes;
    std::vector<server_record> servers;
    std::vector<attachment_record> attachments;

    auto operator==(const store_state&) const -> bool = default;
};

/**
 * @brief Seed state used for collections with no valid stored document
 *
 * Two users (admin/secret, demo/test), one image, one volume and one
 * server; no tokens and no attachments. Entity ids are freshly generated.
 */
[[nodiscard]] auto make_seed_state() -> store_state;

/**
 * @class resource_store
 * @brief Owner of all collections and their persistence
 *
 * Every mutation runs under one exclusive lock as read-modify-flush:
 * the callback edits the state, then all six collections are written to
 * the persistence provider before the lock is released. If the callback
 * fails or the flush fails, the state is restored to what it was before
 * the callback ran. After a flush failure the restored state is written
 * again so documents saved before the failing one do not keep the
 * rejected change.
 *
 * Readers take a shared lock and may run concurrently with each other.
 *
 * @code
 * auto storage = std::make_shared<file_json_storage>(config);
 * auto store = std::make_shared<resource_store>(storage);
 *
 * auto count = store->read([](const store_state& s) { return s.images.size(); });
 *
 * auto added = store->mutate([&](store_state& s) -> Result<volume_record> {
 *     s.volumes.push_back(volume);
 *     return ok(volume);
 * });
 * @endcode
 */
class resource_store {
public:
    /**
     * @brief Load every collection from @p storage
     *
     * A collection whose document is absent, unparsable or of the wrong
     * shape starts from its seed value. Nothing is written until the first
     * mutation or an explicit flush().
     */
    explicit resource_store(std::shared_ptr<json_storage_interface> storage);

    resource_store(const resource_store&) = delete;
    auto operator=(const resource_store&) -> resource_store& = delete;

    /**
     * @brief Run @p fn with shared access to the state
     * @return Whatever @p fn returns
     */
    template <typename Fn>
    auto read(Fn&& fn) const -> std::invoke_result_t<Fn, const store_state&> {
        std::shared_lock lock(mutex_);
        return std::forward<Fn>(fn)(std::as_const(state_));
    }

    /**
     * @brief Run @p fn with exclusive access, then flush
     *
     * @p fn must return a Result. On success every collection is flushed
     * before this call returns; a flush failure rolls the state back,
     * rewrites the restored state, and is returned as
     * error_codes::persistence_failed.
     */
    template <typename Fn>
    auto mutate(Fn&& fn) -> std::invoke_result_t<Fn, store_state&> {
        using result_type = std::invoke_result_t<Fn, store_state&>;

        std::unique_lock lock(mutex_);
        auto backup = state_;

        result_type result = std::forward<Fn>(fn)(state_);
        if (result.is_err()) {
            state_ = std::move(backup);
            return result;
        }

        auto flushed = flush_locked();
        if (flushed.is_err()) {
            restore_locked(std::move(backup));
            return result_type(flushed.error());
        }

        return result;
    }

    /**
     * @brief Write all six collections unconditionally
     */
    [[nodiscard]] auto flush() -> VoidResult;

    /**
     * @brief Copy of the current state
     */
    [[nodiscard]] auto snapshot() const -> store_state;

private:
    [[nodiscard]] auto flush_locked() -> VoidResult;

    void restore_locked(store_state backup);

    void load_locked();

    std::shared_ptr<json_storage_interface> storage_;
    store_state state_;
    mutable std::shared_mutex mutex_;
};

} // namespace osmock::storage
