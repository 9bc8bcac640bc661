#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace modex {

/// The shared "modex" logger (stdout colour sink), created on first use.
std::shared_ptr<spdlog::logger> logger();

/// Parse a level name (trace, debug, info, warn, error, critical, off).
/// Throws ConfigError for anything else.
spdlog::level::level_enum parseLogLevel(const std::string& name);

void setLogLevel(spdlog::level::level_enum level);

} // namespace modex
