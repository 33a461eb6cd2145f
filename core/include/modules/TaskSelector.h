#ifndef TASK_SELECTOR_MODULE_H
#define TASK_SELECTOR_MODULE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

#include "kernel/Task.h"
#include "kernel/TaskRegistry.h"
#include "kernel/World.h"

// Controller levels run 1..8; index 0 is unused
constexpr std::size_t kControllerLevels = 9;

// Selection thresholds. Defaults follow the host game's constants; they
// are tuning knobs, not rules.
struct SelectorPolicy {
    // Upgrade first when ticksToDowngrade < dangerTicks[level] - dangerMargin
    std::array<std::uint32_t, kControllerLevels> dangerTicks{
        0, 10000, 5000, 10000, 20000, 40000, 60000, 75000, 100000};
    std::uint32_t dangerMargin = 1000;

    // Road hits by the terrain under it; repair when hits < roadHits * repairFactor
    std::array<std::uint32_t, static_cast<std::size_t>(Terrain::COUNT)> roadHits{5000, 25000, 750000};
    double repairFactor = 0.75;
};

// Two uniform draws over [0, n), keep the larger. Biases toward the later
// candidates. n must be > 0.
std::size_t pickBiasedIndex(std::size_t n, std::mt19937_64& rng);

class TaskSelector {
public:
    explicit TaskSelector(const SelectorPolicy& policy = SelectorPolicy());

    // Fills a vacant entry with the creep's next task. Returns false when
    // nothing qualifies (the creep idles this tick).
    bool select(const World& world, const CreepState& creep,
                TaskRegistry::Entry& entry, std::mt19937_64& rng) const;

    // Priority scan for a creep carrying energy
    std::optional<TaskHandle> chooseDelivery(const World& world, const RoomSnapshot& room) const;

    // Biased source pick for an empty creep
    std::optional<TaskHandle> chooseHarvest(const RoomSnapshot& room, std::mt19937_64& rng) const;

    std::uint32_t dangerThreshold(int level) const;
    std::uint32_t repairThreshold(Terrain terrain) const;

    const SelectorPolicy& policy() const { return policy_; }

private:
    SelectorPolicy policy_;

    bool controllerInDanger(const ControllerState& controller) const;
    std::optional<TaskHandle> firstStoreTarget(const RoomSnapshot& room, StructureKind kind) const;
};

#endif
