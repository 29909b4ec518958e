// File: src/core/logging.cpp
#include "core/logging.hpp"
#include <spdlog/spdlog.h>
#include <array>

namespace engram {

namespace {

constexpr std::array<const char*, 7> kLevelNames = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

} // namespace

bool IsValidLogLevel(const std::string& level) {
    for (const char* name : kLevelNames) {
        if (level == name) {
            return true;
        }
    }
    return false;
}

bool ConfigureLogging(const std::string& level) {
    if (!IsValidLogLevel(level)) {
        spdlog::warn("Unknown log level '{}'", level);
        return false;
    }
    spdlog::set_level(spdlog::level::from_str(level));
    return true;
}

} // namespace engram
