/**
 * @file identifiers.hpp
 * @brief Opaque identifier and timestamp generation
 *
 * Every entity and bearer token minted by osmock receives a random
 * RFC 4122 version 4 UUID. Creation timestamps are UTC ISO 8601 strings
 * with microsecond precision and a trailing 'Z'.
 */

#pragma once

#include <chrono>
#include <string>

namespace osmock::core {

/**
 * @brief Generate a random version 4 UUID string
 *
 * Thread-safe.
 *
 * @return Lowercase UUID, e.g. "3f2b8c1e-9a4d-4f6e-b1c2-7d8e9f0a1b2c"
 */
[[nodiscard]] auto generate_uuid() -> std::string;

/**
 * @brief Format a time point as "YYYY-MM-DDTHH:MM:SS.ffffffZ"
 */
[[nodiscard]] auto format_iso8601(std::chrono::system_clock::time_point tp)
    -> std::string;

/**
 * @brief Current UTC time formatted with format_iso8601()
 */
[[nodiscard]] auto now_iso8601() -> std::string;

} // namespace osmock::core
