#include "kernel/Kernel.h"

#include <exception>
#include <string>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "utils/TickTimer.h"

Kernel::Kernel(const KernelConfig& cfg)
    : cfg_(cfg),
      selector_(cfg.selector),
      executor_(cfg.executor),
      population_(cfg.population),
      defense_(cfg.defense) {}

void Kernel::reset(const KernelConfig& cfg) {
    // Build everything first so a bad config leaves the kernel untouched
    TaskSelector selector(cfg.selector);
    TaskExecutor executor(cfg.executor);
    PopulationController population(cfg.population);
    DefenseController defense(cfg.defense);

    cfg_ = cfg;
    selector_ = selector;
    executor_ = executor;
    population_ = population;
    defense_ = defense;
    lastReport_ = TickReport{};
}

TickReport Kernel::step(World& world, WorkerState& state) {
    TickTimer timer("Main Loop", world);
    TickReport report;
    report.tick = world.time();

    defense_.run(world, report);

    // Names are collected up front; each entry is looked up again while
    // processing, so evicting the current one never disturbs the loop
    const auto creeps = world.creeps();
    if (cfg_.pruneDeadAgents) {
        std::unordered_set<std::string> live;
        live.reserve(creeps.size());
        for (const auto& creep : creeps) {
            live.insert(creep.name);
        }
        report.entriesPruned = static_cast<std::uint32_t>(state.registry.prune(live));
    }

    for (const auto& creep : creeps) {
        if (creep.spawning) {
            report.agentsSpawning++;
            continue;
        }
        try {
            processAgent(world, state, creep, report);
        } catch (const std::exception& e) {
            spdlog::error("[Kernel] tick {}: {} failed: {}", report.tick, creep.name, e.what());
        }
        report.agentsProcessed++;
    }

    population_.run(world, report);

    state.ticksRun++;
    report.cpuUsed = timer.elapsed();
    spdlog::debug("[Kernel] tick {}: {} agents, {} assigned, {} evicted, {} idle, {} tasks held",
                  report.tick, report.agentsProcessed, report.tasksAssigned, report.tasksEvicted,
                  report.idleAgents, state.registry.size());
    lastReport_ = report;
    return report;
}

void Kernel::processAgent(World& world, WorkerState& state, const CreepState& creep, TickReport& report) const {
    auto entry = state.registry.entry(creep.name);

    if (entry.occupied()) {
        const TaskOutcome outcome = executor_.execute(world, creep, entry, report);
        if (outcome == TaskOutcome::Acted || outcome == TaskOutcome::Moved) {
            return;
        }
    }

    // Vacant from the start, or vacated just now
    if (selector_.select(world, creep, entry, state.rng)) {
        report.tasksAssigned++;
    } else {
        report.idleAgents++;
        report.count(Failure::EmptyCandidateSet);
    }
}
