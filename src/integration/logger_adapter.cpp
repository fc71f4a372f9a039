/**
 * @file logger_adapter.cpp
 * @brief Implementation of the logging facade
 */

#include <osmock/integration/logger_adapter.hpp>
#include <osmock/core/identifiers.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <fstream>
#include <mutex>

namespace osmock::integration {

auto log_level_from_string(std::string_view name) -> std::optional<log_level> {
    if (name == "trace") return log_level::trace;
    if (name == "debug") return log_level::debug;
    if (name == "info") return log_level::info;
    if (name == "warn" || name == "warning") return log_level::warn;
    if (name == "error") return log_level::error;
    if (name == "fatal" || name == "critical") return log_level::fatal;
    if (name == "off") return log_level::off;
    return std::nullopt;
}

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);

        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_audit_log) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
            if (ec) {
                // Fall back to console-only logging
                config_.enable_file = false;
                config_.enable_audit_log = false;
            }
        }

        logger_ = std::make_unique<kcenon::logger::logger>(
            config_.async_mode, config_.buffer_size);
        logger_->set_min_level(convert_log_level(config_.min_level));

        if (config_.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }

        if (config_.enable_file) {
            auto log_path = config_.log_directory / "osmock.log";
            logger_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                log_path.string(),
                config_.max_file_size_mb * 1024 * 1024,
                config_.max_files));
        }

        logger_->start();

        if (config_.enable_audit_log) {
            audit_log_path_ = config_.log_directory / "audit.json";
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);

        if (!initialized_) {
            return;
        }

        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }

        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        if (!initialized_ || !logger_ || !is_level_enabled(level)) {
            return;
        }
        logger_->log(convert_log_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(convert_log_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level {
        return min_level_.load();
    }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void write_audit_log(const std::string& event_type,
                         const std::string& description,
                         const std::string& subject) {
        if (!initialized_ || !config_.enable_audit_log) {
            return;
        }

        nlohmann::json entry;
        entry["timestamp"] = core::now_iso8601();
        entry["event_type"] = event_type;
        entry["description"] = description;
        if (!subject.empty()) {
            entry["subject"] = subject;
        }

        std::lock_guard lock(audit_mutex_);
        std::ofstream file(audit_log_path_, std::ios::app);
        if (!file) {
            log(log_level::error,
                "Unable to open audit log: " + audit_log_path_.string());
            return;
        }
        file << entry.dump() << '\n';
    }

private:
    [[nodiscard]] static auto convert_log_level(log_level level)
        -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace:
                return kcenon::logger::log_level::trace;
            case log_level::debug:
                return kcenon::logger::log_level::debug;
            case log_level::info:
                return kcenon::logger::log_level::info;
            case log_level::warn:
                return kcenon::logger::log_level::warn;
            case log_level::error:
                return kcenon::logger::log_level::error;
            case log_level::fatal:
                return kcenon::logger::log_level::fatal;
            case log_level::off:
            default:
                return kcenon::logger::log_level::off;
        }
    }

    mutable std::mutex mutex_;
    mutable std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::filesystem::path audit_log_path_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Public Interface
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

void logger_adapter::log_security_event(security_event_type type,
                                        const std::string& description,
                                        const std::string& subject) {
    auto type_str = security_event_to_string(type);

    switch (type) {
        case security_event_type::authentication_success:
        case security_event_type::token_revoked:
            info("Security event: {} - {}", type_str, description);
            break;
        case security_event_type::authentication_failure:
            warn("Security event: {} - {}", type_str, description);
            break;
        case security_event_type::token_rejected:
            debug("Security event: {} - {}", type_str, description);
            break;
    }

    pimpl_->write_audit_log(type_str, description, subject);
}

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> const logger_config& {
    return pimpl_->get_config();
}

auto logger_adapter::security_event_to_string(security_event_type type)
    -> std::string {
    switch (type) {
        case security_event_type::authentication_success:
            return "AUTHENTICATION_SUCCESS";
        case security_event_type::authentication_failure:
            return "AUTHENTICATION_FAILURE";
        case security_event_type::token_revoked:
            return "TOKEN_REVOKED";
        case security_event_type::token_rejected:
            return "TOKEN_REJECTED";
    }
    return "UNKNOWN";
}

}  // namespace osmock::integration
