#pragma once

#include <cstdlib>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace RecordForge {
namespace logging {

inline constexpr const char * LOGGER_NAME = "recordforge";
inline constexpr const char * LEVEL_ENV = "RECORDFORGE_LOG_LEVEL";

/// Level named by RECORDFORGE_LOG_LEVEL, warn when unset or not a spdlog level name.
inline spdlog::level::level_enum levelFromEnvironment() {
    const char * env = std::getenv(LEVEL_ENV);
    if(env == nullptr) {
        return spdlog::level::warn;
    }
    std::string name(env);
    spdlog::level::level_enum lvl = spdlog::level::from_str(name);
    if(lvl == spdlog::level::off && name != "off") {
        return spdlog::level::warn;
    }
    return lvl;
}

/// The library's logger, stderr. Reuses a logger registered under the same name by the
/// application, so sinks and level can be configured from outside.
inline std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if(auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_level(levelFromEnvironment());
        return created;
    }();
    return instance;
}

} // namespace logging
} // namespace RecordForge
