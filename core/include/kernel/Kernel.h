#ifndef KERNEL_H
#define KERNEL_H

#include <cstdint>
#include <random>

#include "kernel/TaskRegistry.h"
#include "kernel/TickReport.h"
#include "kernel/World.h"
#include "modules/Defense.h"
#include "modules/Population.h"
#include "modules/TaskExecutor.h"
#include "modules/TaskSelector.h"

// ---------- Configuration ----------
struct KernelConfig {
    std::uint64_t seed = 200;        // worker RNG seed after a restart
    bool pruneDeadAgents = true;     // drop registry entries of vanished creeps
    SelectorPolicy selector;
    ExecutorPolicy executor;
    PopulationTable population;
    DefensePolicy defense;
};

// ---------- Worker State ----------
// Everything that survives between ticks. It lives exactly as long as the
// worker process; restart() is what a worker reset looks like, and nothing
// may depend on it surviving one.
struct WorkerState {
    explicit WorkerState(std::uint64_t seed = 200) : rng(seed) {}

    void restart(std::uint64_t seed) {
        registry.clear();
        rng.seed(seed);
        ticksRun = 0;
    }

    TaskRegistry registry;
    std::mt19937_64 rng;
    std::uint64_t ticksRun = 0;
};

// ---------- Kernel Engine ----------
class Kernel {
public:
    explicit Kernel(const KernelConfig& cfg);

    // Lifecycle
    void reset(const KernelConfig& cfg);

    // One tick: defense, then every creep, then population. The worker state
    // is exclusively borrowed for the duration of the call.
    TickReport step(World& world, WorkerState& state);

    // Access
    const KernelConfig& config() const { return cfg_; }
    const TaskSelector& selector() const { return selector_; }
    const TaskExecutor& executor() const { return executor_; }
    const PopulationController& population() const { return population_; }
    const TickReport& lastReport() const { return lastReport_; }

private:
    void processAgent(World& world, WorkerState& state, const CreepState& creep, TickReport& report) const;

    KernelConfig cfg_;
    TaskSelector selector_;
    TaskExecutor executor_;
    PopulationController population_;
    DefenseController defense_;
    TickReport lastReport_;
};

#endif // KERNEL_H
