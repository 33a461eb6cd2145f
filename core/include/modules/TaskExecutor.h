#ifndef TASK_EXECUTOR_MODULE_H
#define TASK_EXECUTOR_MODULE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>

#include "kernel/Task.h"
#include "kernel/TaskRegistry.h"
#include "kernel/TickReport.h"
#include "kernel/World.h"

// Ranges of the terminal actions
constexpr int kContactRange = 1;  // harvest, transfer
constexpr int kRangedRange = 3;   // build, repair, upgrade

// Path reuse hints handed to World::moveTo, indexed by TaskKind. Short for
// targets that come and go, long for the controller.
struct ExecutorPolicy {
    std::array<std::uint32_t, static_cast<std::size_t>(TaskKind::COUNT)> reusePath{
        50,  // Upgrade
        5,   // Harvest
        15,  // Construct
        10,  // Repair
        10   // Store
    };
};

enum class TaskOutcome : std::uint8_t {
    Acted,      // terminal action succeeded, task kept
    Moved,      // stepped toward the target, task kept
    Completed,  // single-shot task done, entry vacated
    Evicted     // stale, gone or rejected, entry vacated
};

const char* toString(TaskOutcome outcome);

class TaskExecutor {
public:
    explicit TaskExecutor(const ExecutorPolicy& policy = ExecutorPolicy());

    // Advances the creep's task by one tick. The entry must be occupied.
    TaskOutcome execute(World& world, const CreepState& creep,
                        TaskRegistry::Entry& entry, TickReport& report) const;

    static int actionRange(TaskKind kind);
    std::uint32_t reuseHint(TaskKind kind) const;

    const ExecutorPolicy& policy() const { return policy_; }

private:
    ExecutorPolicy policy_;

    TaskOutcome approachAndAct(World& world, const CreepState& creep, TaskRegistry::Entry& entry,
                               const TaskHandle& task, const Position& target,
                               const std::function<ActionResult()>& action, TickReport& report) const;
    TaskOutcome evict(TaskRegistry::Entry& entry, Failure reason, TickReport& report) const;
};

#endif
