// =============================================================================
// log.cpp - Engine logger
// =============================================================================

#include "predix/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace predix {

std::shared_ptr<spdlog::logger> log() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;
    std::call_once(once, [] {
        logger = spdlog::get("predix");
        if (!logger) {
            logger = spdlog::stderr_color_mt("predix");
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        }
    });
    return logger;
}

void set_log_level(const std::string& level) {
    log()->set_level(spdlog::level::from_str(level));
}

} // namespace predix
