/**
 * @file auth_service.cpp
 * @brief Implementation of password login and token revocation
 */

#include <osmock/security/auth_service.hpp>

#include <osmock/core/identifiers.hpp>
#include <osmock/integration/logger_adapter.hpp>
#include <osmock/storage/resource_store.hpp>

#include <nlohmann/json.hpp>

#include <initializer_list>

namespace osmock::security {

using integration::logger_adapter;
using integration::security_event_type;

namespace {

/// Follow @p path through nested objects; nullptr if any step is missing
auto find_path(const nlohmann::json& root,
               std::initializer_list<const char*> path) -> const nlohmann::json* {
    const nlohmann::json* node = &root;
    for (const char* key : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(key);
        if (it == node->end()) {
            return nullptr;
        }
        node = &*it;
    }
    return node;
}

}  // namespace

auto parse_password_credentials(const nlohmann::json& body)
    -> Result<password_credentials> {
    const auto* user = find_path(body, {"auth", "identity", "password", "user"});
    if (user == nullptr || !user->is_object()) {
        return osmock_error<password_credentials>(
            error_codes::bad_request, "Malformed authentication body");
    }

    auto name = user->find("name");
    auto password = user->find("password");
    if (name == user->end() || !name->is_string() ||
        password == user->end() || !password->is_string()) {
        return osmock_error<password_credentials>(
            error_codes::bad_request, "Malformed authentication body");
    }

    return ok(password_credentials{name->get<std::string>(),
                                   password->get<std::string>()});
}

void to_json(nlohmann::json& j, const login_result& result) {
    j = {{"token", result.token},
         {"user",
          {{"id", result.user_id},
           {"name", result.user_name},
           {"role", result.role}}},
         {"project", {{"id", "mock-project"}, {"name", "MockProject"}}}};
}

auth_service::auth_service(std::shared_ptr<storage::resource_store> store)
    : store_(std::move(store)) {}

auto auth_service::login(const password_credentials& credentials)
    -> Result<login_result> {
    auto result = store_->mutate(
        [&](storage::store_state& state) -> Result<login_result> {
            auto it = state.users.find(credentials.name);
            if (it == state.users.end() ||
                it->second.password != credentials.password) {
                return osmock_error<login_result>(error_codes::unauthorized,
                                                  "Bad credentials");
            }

            const auto& user = it->second;
            login_result issued{core::generate_uuid(), user.id,
                                credentials.name, user.role};
            state.tokens[issued.token] = user.id;
            return ok(std::move(issued));
        });

    if (result.is_ok()) {
        logger_adapter::log_security_event(
            security_event_type::authentication_success,
            "Token issued for " + credentials.name, result.value().user_id);
    } else if (result.error().code == error_codes::unauthorized) {
        logger_adapter::log_security_event(
            security_event_type::authentication_failure,
            "Bad credentials for " + credentials.name, credentials.name);
    }

    return result;
}

auto auth_service::logout(std::string_view token) -> VoidResult {
    std::string revoked_user;

    auto result = store_->mutate([&](storage::store_state& state) -> VoidResult {
        auto it = state.tokens.find(std::string(token));
        if (it != state.tokens.end()) {
            revoked_user = it->second;
            state.tokens.erase(it);
        }
        return ok();
    });

    if (result.is_ok() && !revoked_user.empty()) {
        logger_adapter::log_security_event(security_event_type::token_revoked,
                                           "Token revoked", revoked_user);
    }

    return result;
}

} // namespace osmock::security
