#include "common/log.hpp"
#include "common/errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace modex {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get("modex")) {
            return existing;
        }
        auto created = spdlog::stdout_color_mt("modex");
        created->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return instance;
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    throw ConfigError("unknown log level '" + name + "'", "logging.level");
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace modex
