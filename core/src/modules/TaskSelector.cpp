#include "modules/TaskSelector.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace {
std::optional<StoreTargetRef> makeStoreRef(StructureKind kind, const std::string& id) {
    switch (kind) {
        case StructureKind::Spawn: return StoreTargetRef{SpawnRef{id}};
        case StructureKind::Extension: return StoreTargetRef{ExtensionRef{id}};
        case StructureKind::Tower: return StoreTargetRef{TowerRef{id}};
        default: break;
    }
    return std::nullopt;
}
}

std::size_t pickBiasedIndex(std::size_t n, std::mt19937_64& rng) {
    if (n == 0) {
        throw std::invalid_argument("pickBiasedIndex needs at least one candidate");
    }
    std::uniform_int_distribution<std::size_t> dist(0, n - 1);
    const std::size_t first = dist(rng);
    const std::size_t second = dist(rng);
    return std::max(first, second);
}

TaskSelector::TaskSelector(const SelectorPolicy& policy) : policy_(policy) {
    if (policy_.repairFactor <= 0.0 || policy_.repairFactor > 1.0) {
        throw std::invalid_argument("repairFactor must be in (0, 1] (got " +
                                    std::to_string(policy_.repairFactor) + ")");
    }
}

bool TaskSelector::select(const World& world, const CreepState& creep,
                          TaskRegistry::Entry& entry, std::mt19937_64& rng) const {
    auto room = world.room(creep.pos.room);
    if (!room) {
        spdlog::debug("[Selector] {} is in unknown room '{}'", creep.name, creep.pos.room);
        return false;
    }

    auto task = (creep.energy.used > 0) ? chooseDelivery(world, *room) : chooseHarvest(*room, rng);
    if (!task) {
        spdlog::debug("[Selector] {} found nothing to do", creep.name);
        return false;
    }

    spdlog::debug("[Selector] {} -> {}", creep.name, describe(*task));
    entry.insert(std::move(*task));
    return true;
}

// Life support, then production, then defense, then infrastructure, then
// growth; the controller fallback always matches in an owned room.
std::optional<TaskHandle> TaskSelector::chooseDelivery(const World& world, const RoomSnapshot& room) const {
    const bool ownController = room.controller && room.controller->my;

    if (ownController && controllerInDanger(*room.controller)) {
        return TaskHandle{UpgradeTask{ControllerRef{room.controller->id}}};
    }

    for (auto kind : {StructureKind::Spawn, StructureKind::Extension, StructureKind::Tower}) {
        if (auto task = firstStoreTarget(room, kind)) {
            return task;
        }
    }

    for (const auto& s : room.structures) {
        if (s.kind != StructureKind::Road) continue;
        if (s.hits < repairThreshold(world.terrainAt(s.pos))) {
            return TaskHandle{RepairTask{StructureRef{s.id}}};
        }
    }

    for (const auto& site : room.sites) {
        if (site.my) {
            return TaskHandle{ConstructTask{SiteRef{site.id}}};
        }
    }

    if (ownController) {
        return TaskHandle{UpgradeTask{ControllerRef{room.controller->id}}};
    }
    return std::nullopt;
}

std::optional<TaskHandle> TaskSelector::chooseHarvest(const RoomSnapshot& room, std::mt19937_64& rng) const {
    if (room.activeSources.empty()) {
        return std::nullopt;
    }
    // bias the second node
    const auto idx = pickBiasedIndex(room.activeSources.size(), rng);
    return TaskHandle{HarvestTask{SourceRef{room.activeSources[idx].id}}};
}

std::uint32_t TaskSelector::dangerThreshold(int level) const {
    const auto idx = static_cast<std::size_t>(std::clamp(level, 1, static_cast<int>(kControllerLevels) - 1));
    const std::uint32_t ticks = policy_.dangerTicks[idx];
    return (ticks > policy_.dangerMargin) ? ticks - policy_.dangerMargin : 0;
}

std::uint32_t TaskSelector::repairThreshold(Terrain terrain) const {
    const auto hits = policy_.roadHits[static_cast<std::size_t>(terrain)];
    return static_cast<std::uint32_t>(hits * policy_.repairFactor);
}

bool TaskSelector::controllerInDanger(const ControllerState& controller) const {
    return controller.ticksToDowngrade < dangerThreshold(controller.level);
}

std::optional<TaskHandle> TaskSelector::firstStoreTarget(const RoomSnapshot& room, StructureKind kind) const {
    for (const auto& s : room.structures) {
        if (s.kind != kind || !s.my || !s.energy || s.energy->free() == 0) continue;
        if (auto ref = makeStoreRef(kind, s.id)) {
            return TaskHandle{StoreTask{*ref}};
        }
    }
    return std::nullopt;
}
