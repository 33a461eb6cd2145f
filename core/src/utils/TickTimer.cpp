#include "utils/TickTimer.h"

#include <utility>

#include <spdlog/spdlog.h>

#include "kernel/World.h"

TickTimer::TickTimer(std::string name, const World& world)
    : name_(std::move(name)), world_(world), loaded_(world.cpuUsed()) {}

TickTimer::~TickTimer() {
    spdlog::info("{} done! init at {:.2f}cpu, added {:.2f}cpu", name_, loaded_, elapsed());
}

double TickTimer::elapsed() const {
    return world_.cpuUsed() - loaded_;
}
