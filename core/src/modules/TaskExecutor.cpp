#include "modules/TaskExecutor.h"

#include <spdlog/spdlog.h>

#include "kernel/Resolver.h"

namespace {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
}

const char* toString(TaskOutcome outcome) {
    switch (outcome) {
        case TaskOutcome::Acted: return "acted";
        case TaskOutcome::Moved: return "moved";
        case TaskOutcome::Completed: return "completed";
        case TaskOutcome::Evicted: return "evicted";
    }
    return "unknown";
}

TaskExecutor::TaskExecutor(const ExecutorPolicy& policy) : policy_(policy) {}

int TaskExecutor::actionRange(TaskKind kind) {
    switch (kind) {
        case TaskKind::Harvest:
        case TaskKind::Store:
            return kContactRange;
        default:
            return kRangedRange;
    }
}

std::uint32_t TaskExecutor::reuseHint(TaskKind kind) const {
    return policy_.reusePath[static_cast<std::size_t>(kind)];
}

TaskOutcome TaskExecutor::execute(World& world, const CreepState& creep,
                                  TaskRegistry::Entry& entry, TickReport& report) const {
    // Copy: eviction destroys the registry's instance
    const TaskHandle task = entry.task();

    // A task that no longer fits the creep's load is stale
    auto stale = [&]() {
        spdlog::debug("[Executor] {} dropping stale {}", creep.name, describe(task));
        entry.remove();
        report.tasksEvicted++;
        return TaskOutcome::Evicted;
    };

    return std::visit(overloaded{
        [&](const UpgradeTask& t) {
            if (creep.energy.used == 0) return stale();
            auto controller = resolve(world, t.controller);
            if (!controller) return evict(entry, Failure::ReferentGone, report);
            return approachAndAct(world, creep, entry, task, controller->pos,
                                  [&]() { return world.upgradeController(creep.name, t.controller.id); }, report);
        },
        [&](const HarvestTask& t) {
            if (creep.energy.free() == 0) return stale();
            auto source = resolve(world, t.source);
            if (!source) return evict(entry, Failure::ReferentGone, report);
            return approachAndAct(world, creep, entry, task, source->pos,
                                  [&]() { return world.harvest(creep.name, t.source.id); }, report);
        },
        [&](const ConstructTask& t) {
            auto site = resolve(world, t.site);
            if (!site) return evict(entry, Failure::ReferentGone, report);
            return approachAndAct(world, creep, entry, task, site->pos,
                                  [&]() { return world.build(creep.name, t.site.id); }, report);
        },
        [&](const RepairTask& t) {
            auto structure = resolve(world, t.structure);
            if (!structure) return evict(entry, Failure::ReferentGone, report);
            auto outcome = approachAndAct(world, creep, entry, task, structure->pos,
                                          [&]() { return world.repair(creep.name, t.structure.id); }, report);
            if (outcome != TaskOutcome::Acted) return outcome;
            // One repair per selection; the priority scan re-picks it if still needed
            entry.remove();
            report.tasksCompleted++;
            return TaskOutcome::Completed;
        },
        [&](const StoreTask& t) {
            auto target = resolve(world, t.target);
            if (!target) return evict(entry, Failure::ReferentGone, report);
            return approachAndAct(world, creep, entry, task, target->pos,
                                  [&]() { return world.transfer(creep.name, target->id, ResourceKind::Energy); },
                                  report);
        },
    }, task);
}

TaskOutcome TaskExecutor::approachAndAct(World& world, const CreepState& creep, TaskRegistry::Entry& entry,
                                         const TaskHandle& task, const Position& target,
                                         const std::function<ActionResult()>& action, TickReport& report) const {
    const TaskKind kind = kindOf(task);

    if (rangeBetween(creep.pos, target) <= actionRange(kind)) {
        const ActionResult result = action();
        if (result == ActionResult::Ok) {
            report.actionsOk++;
            return TaskOutcome::Acted;
        }

        const Failure failure = classifyAction(result);
        report.count(failure);
        if (failure != Failure::OutOfRange) {
            // An emptied carrier's next transfer is routine turnover
            if (kind == TaskKind::Store && result == ActionResult::NotEnoughResources) {
                spdlog::debug("[Executor] {} {} done: {}", creep.name, describe(task), toString(result));
            } else {
                spdlog::warn("[Executor] {} {} rejected: {}", creep.name, describe(task), toString(result));
            }
            entry.remove();
            report.tasksEvicted++;
            return TaskOutcome::Evicted;
        }
        // Host disagrees about the range; walk closer
    }

    const ActionResult moved = world.moveTo(creep.name, target, reuseHint(kind));
    report.moves++;
    if (moved != ActionResult::Ok && moved != ActionResult::Tired) {
        spdlog::debug("[Executor] {} move toward {} failed: {}", creep.name, describe(task), toString(moved));
    }
    return TaskOutcome::Moved;
}

TaskOutcome TaskExecutor::evict(TaskRegistry::Entry& entry, Failure reason, TickReport& report) const {
    spdlog::debug("[Executor] {} evicting task: {}", entry.agent(), toString(reason));
    report.count(reason);
    entry.remove();
    report.tasksEvicted++;
    return TaskOutcome::Evicted;
}
