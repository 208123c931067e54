#pragma once

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace bindiag::log {

/// Name under which the library logger is registered with spdlog
inline constexpr const char* logger_name = "bindiag";

/**
 * @brief Library logger
 *
 * Returns the spdlog logger registered as "bindiag". If the application has not
 * registered one, a colored stderr logger is created on first use. Applications
 * that want the output elsewhere register their own logger under the same name
 * before the first call.
 */
[[nodiscard]] inline std::shared_ptr<spdlog::logger> logger() {
    if (auto existing = spdlog::get(logger_name)) {
        return existing;
    }
    try {
        return spdlog::stderr_color_mt(logger_name);
    } catch (const spdlog::spdlog_ex&) {
        // Another thread registered it between the lookup and the creation.
        return spdlog::get(logger_name);
    }
}

} // namespace bindiag::log
