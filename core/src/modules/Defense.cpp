#include "modules/Defense.h"

#include <exception>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

DefenseController::DefenseController(const DefensePolicy& policy) : policy_(policy) {
    if (policy_.towerRange <= 0) {
        throw std::invalid_argument("towerRange must be > 0 (got " + std::to_string(policy_.towerRange) + ")");
    }
}

void DefenseController::run(World& world, TickReport& report) const {
    for (const auto& roomName : world.roomNames()) {
        auto room = world.room(roomName);
        if (!room || room->hostiles.empty()) continue;

        for (const auto& tower : room->structures) {
            if (tower.kind != StructureKind::Tower || !tower.my) continue;

            auto target = nearestHostile(tower.pos, room->hostiles);
            if (!target) continue;

            ActionResult result = ActionResult::Ok;
            try {
                result = world.towerAttack(tower.id, target->id);
            } catch (const std::exception& e) {
                spdlog::error("[Defense] {} attack on {} failed: {}", tower.id, target->id, e.what());
                continue;
            }
            if (result == ActionResult::Ok) {
                report.towerAttacks++;
            } else {
                spdlog::warn("[Defense] {} could not attack {}: {}", tower.id, target->id, toString(result));
            }
        }
    }
}

std::optional<HostileState> DefenseController::nearestHostile(const Position& from,
                                                              const std::vector<HostileState>& hostiles) const {
    const HostileState* best = nullptr;
    int bestRange = policy_.towerRange + 1;
    for (const auto& hostile : hostiles) {
        const int range = rangeBetween(from, hostile.pos);
        if (range < bestRange) {
            best = &hostile;
            bestRange = range;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return *best;
}
