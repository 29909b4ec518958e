// File: src/core/logging.hpp
#pragma once

#include <string>

namespace engram {

/// Set the level of the default spdlog logger.
/// @param level One of trace, debug, info, warn, error, critical, off
/// @return false if level is not recognized (level is left unchanged)
bool ConfigureLogging(const std::string& level);

/// True if level names a spdlog level
bool IsValidLogLevel(const std::string& level);

} // namespace engram
