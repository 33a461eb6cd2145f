#include "modules/Population.h"

#include <exception>
#include <stdexcept>

#include <spdlog/spdlog.h>

PopulationController::PopulationController(const PopulationTable& table) : table_(table) {
    if (table_.rows.empty()) {
        throw std::invalid_argument("population table must have at least one row");
    }
    std::uint32_t previous = 0;
    for (std::size_t i = 0; i < table_.rows.size(); ++i) {
        const auto& row = table_.rows[i];
        if (row.loadout.empty()) {
            throw std::invalid_argument("population row " + std::to_string(i) + " has an empty loadout");
        }
        if (i > 0 && row.ceiling <= previous) {
            throw std::invalid_argument("population ceilings must ascend strictly (row " +
                                        std::to_string(i) + ")");
        }
        if (row.cost != loadoutCost(row.loadout)) {
            throw std::invalid_argument("population row " + std::to_string(i) + " declares cost " +
                                        std::to_string(row.cost) + " but its loadout costs " +
                                        std::to_string(loadoutCost(row.loadout)));
        }
        previous = row.ceiling;
    }
}

void PopulationController::run(World& world, TickReport& report) const {
    const std::uint64_t tick = world.time();
    auto population = static_cast<std::uint32_t>(world.creeps().size());
    std::uint32_t sequence = 0;

    for (const auto& roomName : world.roomNames()) {
        auto room = world.room(roomName);
        if (!room) continue;

        for (const auto& spawn : room->structures) {
            if (spawn.kind != StructureKind::Spawn || !spawn.my) continue;
            if (population >= maxPopulation()) return;

            // Energy may have been spent by an earlier spawn in this room
            auto current = world.room(roomName);
            const std::uint32_t energy = current ? current->energyAvailable : 0;

            const PopulationRow* row = selectRow(population, energy);
            if (!row) continue;

            const std::string name = creepName(tick, sequence++);
            report.spawnAttempts++;
            ActionResult result = ActionResult::Ok;
            try {
                result = world.spawnCreep(spawn.id, row->loadout, name);
            } catch (const std::exception& e) {
                report.count(Failure::CreationRejected);
                spdlog::error("[Population] {} spawning {} failed: {}", spawn.id, name, e.what());
                continue;
            }
            if (result != ActionResult::Ok) {
                report.count(Failure::CreationRejected);
                spdlog::warn("[Population] {} could not spawn {} ({} parts): {}",
                             spawn.id, name, row->loadout.size(), toString(result));
                continue;
            }

            spdlog::info("[Population] {} spawning {} ({} energy, population {})",
                         spawn.id, name, row->cost, population);
            report.spawned++;
            population++;
        }
    }
}

const PopulationRow* PopulationController::selectRow(std::uint32_t population,
                                                     std::uint32_t energyAvailable) const {
    for (const auto& row : table_.rows) {
        if (row.ceiling > population && row.cost <= energyAvailable) {
            return &row;
        }
    }
    return nullptr;
}

std::string PopulationController::creepName(std::uint64_t tick, std::uint32_t sequence) {
    return std::to_string(tick) + "-" + std::to_string(sequence);
}
