/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the osmock service
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for osmock, integrating with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>

#include <string>

namespace osmock {

/**
 * @brief Result type alias for osmock operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief osmock-specific error codes
 *
 * Error code range: -900 to -949.
 * The first block maps one-to-one onto client-visible HTTP failures;
 * the second block covers server-side faults.
 */
namespace error_codes {
    constexpr int osmock_base = -900;

    // Client errors (-900 to -919)
    constexpr int bad_request = osmock_base - 0;
    constexpr int unauthorized = osmock_base - 1;
    constexpr int not_found = osmock_base - 2;
    constexpr int conflict = osmock_base - 3;

    // Server errors (-920 to -949)
    constexpr int persistence_failed = osmock_base - 20;
    constexpr int storage_directory_error = osmock_base - 21;
    constexpr int invalid_configuration = osmock_base - 22;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;

/**
 * @brief Create an osmock error result with module context
 * @tparam T The result value type
 * @param code Error code from osmock::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> osmock_error(int code, const std::string& message,
                              const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "osmock");
    }
    return kcenon::common::make_error<T>(code, message, "osmock", details);
}

/**
 * @brief Create an osmock void error result
 */
inline VoidResult osmock_void_error(int code, const std::string& message,
                                    const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "osmock"});
    }
    return VoidResult(error_info{code, message, "osmock", details});
}

} // namespace osmock
