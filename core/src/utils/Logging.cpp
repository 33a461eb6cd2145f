#include "utils/Logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char* kLoggerName = "hive";
constexpr const char* kPattern = "[%H:%M:%S.%e] [%^%l%$] %v";
}

void setupLogging(spdlog::level::level_enum level) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kLoggerName);
        logger->set_pattern(kPattern);
        spdlog::set_default_logger(logger);
    }
    logger->set_level(level);
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off; only "off" itself may mean off
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level '{}', using info", name);
        return spdlog::level::info;
    }
    return level;
}
