#ifndef PREDIX_LOG_HPP
#define PREDIX_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace predix {

// Shared "predix" logger (stderr, created on first use)
std::shared_ptr<spdlog::logger> log();

// Accepts trace/debug/info/warn/error/off
void set_log_level(const std::string& level);

} // namespace predix

#endif // PREDIX_LOG_HPP
