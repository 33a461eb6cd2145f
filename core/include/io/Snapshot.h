#ifndef KERNEL_SNAPSHOT_H
#define KERNEL_SNAPSHOT_H

#include <cstdint>
#include <iosfwd>
#include <string>

#include "kernel/TaskRegistry.h"
#include "kernel/TickReport.h"

// JSON export of the task registry
std::string registryToJson(const TaskRegistry& registry, std::uint64_t tick);

// CSV report logging
std::string reportCsvHeader();
void logReport(const TickReport& report, std::ostream& out);

#endif
