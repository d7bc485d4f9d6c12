#ifndef PREDIX_LOG_HPP
#define PREDIX_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace predix {
namespace log {

// Shared "predix" logger (stderr, colored); registered once per process.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names: trace, debug, info, warn, error, critical, off
void set_level(const std::string& level);

} // namespace log
} // namespace predix

#endif // PREDIX_LOG_HPP
