/**
 * @file user_record.hpp
 * @brief Seeded user accounts and issued bearer tokens
 */

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <map>
#include <string>

namespace osmock::storage {

/**
 * @brief A login account
 *
 * Users are seed data only; the API never creates or deletes them.
 * Passwords are stored and compared in plain text.
 */
struct user_record {
    /// Login name (natural key, also the key of the persisted object)
    std::string username;

    std::string password;

    /// Opaque user identifier, e.g. "user-1"
    std::string id;

    /// Informational role ("admin", "user"); never enforced
    std::string role;

    std::string domain{"default"};

    auto operator==(const user_record&) const -> bool = default;
};

/// Users keyed by username
using user_map = std::map<std::string, user_record>;

/// Bearer token -> owning user id
using token_map = std::map<std::string, std::string>;

/**
 * @brief Serialize users as {"<username>": {"password", "id", "role", "domain"}}
 */
[[nodiscard]] auto users_to_json(const user_map& users) -> nlohmann::json;

/**
 * @brief Parse the users document
 * @throws nlohmann::json::exception if the document has the wrong shape
 */
[[nodiscard]] auto users_from_json(const nlohmann::json& doc) -> user_map;

} // namespace osmock::storage
