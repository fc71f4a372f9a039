/**
 * @file credential_gate.hpp
 * @brief Bearer token validation for protected operations
 */

#pragma once

#include <osmock/core/result.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace osmock::storage {
class resource_store;
} // namespace osmock::storage

namespace osmock::security {

/// Request header carrying the bearer token on protected calls
inline constexpr const char* auth_token_header = "X-Auth-Token";

/**
 * @class credential_gate
 * @brief Resolves a bearer token to the id of the user it was issued to
 *
 * A token is valid from issuance until logout. There is no expiry and no
 * scope check: any valid token grants access to every collection.
 */
class credential_gate {
public:
    explicit credential_gate(std::shared_ptr<const storage::resource_store> store);

    /**
     * @brief Validate @p token
     * @return Owning user id, or error_codes::unauthorized when the token
     *         is empty or unknown
     */
    [[nodiscard]] auto authenticate(std::string_view token) const
        -> Result<std::string>;

private:
    std::shared_ptr<const storage::resource_store> store_;
};

} // namespace osmock::security
