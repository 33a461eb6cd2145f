#ifndef HIVE_LOGGING_H
#define HIVE_LOGGING_H

#include <string>

#include <spdlog/spdlog.h>

// Installs the "hive" stderr logger as spdlog's default logger. Safe to call
// more than once; later calls only change the level.
void setupLogging(spdlog::level::level_enum level = spdlog::level::info);

// Parses "trace", "debug", "info", "warn", "error", "critical" or "off".
// Unknown names fall back to info with a warning.
spdlog::level::level_enum parseLogLevel(const std::string& name);

#endif
