// =============================================================================
// log.cpp - Shared spdlog logger
// =============================================================================

#include "predix/log.hpp"
#include "predix/error.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace predix {
namespace log {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("predix");
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt("predix");
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

void set_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw Error(ErrorCode::ConfigError, "unknown log level: " + level);
    }
    logger()->set_level(parsed);
}

} // namespace log
} // namespace predix
