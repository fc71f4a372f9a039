/**
 * @file credential_gate.cpp
 * @brief Implementation of bearer token validation
 */

#include <osmock/security/credential_gate.hpp>

#include <osmock/integration/logger_adapter.hpp>
#include <osmock/storage/resource_store.hpp>

#include <optional>

namespace osmock::security {

using integration::logger_adapter;
using integration::security_event_type;

credential_gate::credential_gate(
    std::shared_ptr<const storage::resource_store> store)
    : store_(std::move(store)) {}

auto credential_gate::authenticate(std::string_view token) const
    -> Result<std::string> {
    if (token.empty()) {
        return osmock_error<std::string>(error_codes::unauthorized,
                                         "Invalid or missing token");
    }

    auto user_id = store_->read(
        [&](const storage::store_state& state) -> std::optional<std::string> {
            auto it = state.tokens.find(std::string(token));
            if (it == state.tokens.end()) {
                return std::nullopt;
            }
            return it->second;
        });

    if (!user_id) {
        logger_adapter::log_security_event(security_event_type::token_rejected,
                                           "Unknown bearer token");
        return osmock_error<std::string>(error_codes::unauthorized,
                                         "Invalid or missing token");
    }

    return ok(std::move(*user_id));
}

} // namespace osmock::security
