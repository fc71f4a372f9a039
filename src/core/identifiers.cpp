/**
 * @file identifiers.cpp
 * @brief Implementation of identifier and timestamp generation
 */

#include <osmock/core/identifiers.hpp>

#include <ctime>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace osmock::core {

auto generate_uuid() -> std::string {
    static std::mutex mutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static const char* hex = "0123456789abcdef";

    std::string uuid = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";

    std::lock_guard lock(mutex);
    for (char& c : uuid) {
        if (c == 'x') {
            c = hex[dis(gen)];
        } else if (c == 'y') {
            c = hex[(dis(gen) & 0x3) | 0x8];
        }
    }
    return uuid;
}

auto format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                      tp.time_since_epoch()) %
                  1000000;

    std::tm tm_val{};
#ifdef _WIN32
    gmtime_s(&tm_val, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_val);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(6) << micros.count() << 'Z';
    return oss.str();
}

auto now_iso8601() -> std::string {
    return format_iso8601(std::chrono::system_clock::now());
}

} // namespace osmock::core
