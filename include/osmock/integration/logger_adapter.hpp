/**
 * @file logger_adapter.hpp
 * @brief Application and audit logging on top of logger_system
 *
 * This file provides the logger_adapter class, the single logging entry
 * point of osmock. It forwards application messages to logger_system and
 * keeps a JSON-lines audit trail of credential events (logins, logouts and
 * rejected tokens).
 */

#pragma once

#include <osmock/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace osmock::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse a log level name ("trace", "debug", "info", "warn",
 *        "warning", "error", "fatal", "off")
 */
[[nodiscard]] auto log_level_from_string(std::string_view name)
    -> std::optional<log_level>;

/**
 * @enum security_event_type
 * @brief Credential events recorded in the audit trail
 */
enum class security_event_type {
    authentication_success,
    authentication_failure,
    token_revoked,
    token_rejected
};

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable the audit.json trail of credential events
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{10};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

/**
 * @class logger_adapter
 * @brief Static logging facade used throughout osmock
 *
 * Messages logged before initialize() or after shutdown() are dropped,
 * which keeps unit tests free of log setup.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/osmock";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Listening on {}:{}", "0.0.0.0", 8000);
 * logger_adapter::log_security_event(
 *     security_event_type::authentication_success, "login", "user-1");
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    /**
     * @brief Initialize the logger with configuration
     *
     * Creates the log directory when file or audit output is enabled,
     * attaches console and rotating file writers and starts the logger.
     * A second call without an intervening shutdown() is ignored.
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the logger
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    template <typename... Args>
    static void trace(osmock::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, osmock::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(osmock::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, osmock::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(osmock::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, osmock::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(osmock::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, osmock::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(osmock::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, osmock::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(osmock::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, osmock::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     */
    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    /**
     * @brief Record a credential event
     *
     * Writes the event to the application log and, when enabled, appends
     * a JSON line to audit.json.
     *
     * @param type Type of security event
     * @param description Human-readable description
     * @param subject User name or id the event concerns (may be empty)
     */
    static void log_security_event(security_event_type type,
                                   const std::string& description,
                                   const std::string& subject = "");

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    [[nodiscard]] static auto security_event_to_string(security_event_type type)
        -> std::string;

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace osmock::integration
