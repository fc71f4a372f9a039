/**
 * @file auth_service.hpp
 * @brief Password login and token revocation
 */

#pragma once

#include <osmock/core/result.hpp>

#include <nlohmann/json_fwd.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace osmock::storage {
class resource_store;
} // namespace osmock::storage

namespace osmock::security {

/// Response header repeating the token issued by a successful login
inline constexpr const char* subject_token_header = "X-Subject-Token";

/**
 * @brief Credentials from auth.identity.password.user
 */
struct password_credentials {
    std::string name;
    std::string password;
};

/**
 * @brief Extract credentials from a token request body
 *
 * The body must contain string values at auth.identity.password.user.name
 * and auth.identity.password.user.password.
 *
 * @return Credentials, or error_codes::bad_request when the path is
 *         missing or either value is not a string
 */
[[nodiscard]] auto parse_password_credentials(const nlohmann::json& body)
    -> Result<password_credentials>;

/**
 * @brief Outcome of a successful login
 */
struct login_result {
    std::string token;
    std::string user_id;
    std::string user_name;
    std::string role;
};

/**
 * @brief Response body {"token", "user": {id, name, role}, "project": {...}}
 *
 * The project is always the synthetic {"id": "mock-project",
 * "name": "MockProject"}.
 */
void to_json(nlohmann::json& j, const login_result& result);

/**
 * @class auth_service
 * @brief Issues and revokes bearer tokens
 */
class auth_service {
public:
    explicit auth_service(std::shared_ptr<storage::resource_store> store);

    /**
     * @brief Check credentials and mint a new token
     *
     * The token is recorded and flushed before this returns.
     *
     * @return Token and user summary, or error_codes::unauthorized when the
     *         user is unknown or the password does not match
     */
    [[nodiscard]] auto login(const password_credentials& credentials)
        -> Result<login_result>;

    /**
     * @brief Revoke @p token
     *
     * Unknown or empty tokens are not an error. State is flushed either way.
     */
    [[nodiscard]] auto logout(std::string_view token) -> VoidResult;

private:
    std::shared_ptr<storage::resource_store> store_;
};

} // namespace osmock::security
