#include "world/Scenarios.h"

#include <random>

#include <spdlog/spdlog.h>

namespace {
Position at(int x, int y) {
    return Position{kStarterRoom, x, y};
}

void buildStarter(SandboxWorld& world, std::mt19937_64& rng) {
    world.addRoom(kStarterRoom);

    // Swamp band across the lower half
    for (int x = 5; x < 45; ++x) {
        world.setTerrain(at(x, 33), Terrain::Swamp);
        world.setTerrain(at(x, 34), Terrain::Swamp);
    }

    world.addController(at(25, 8), 2, 6000);
    world.addStructure(StructureKind::Spawn, at(25, 25));

    for (int i = 0; i < 5; ++i) {
        world.addStructure(StructureKind::Extension, at(22 + i, 28));
    }
    world.addStructure(StructureKind::Tower, at(28, 23));

    // Source placement varies with the seed
    std::uniform_int_distribution<int> jitter(-3, 3);
    world.addSource(at(8 + jitter(rng), 40 + jitter(rng)));
    world.addSource(at(41 + jitter(rng), 12 + jitter(rng)));

    // Road south from the spawn, worn where it crosses the swamp
    for (int y = 26; y <= 36; ++y) {
        const std::string road = world.addStructure(StructureKind::Road, at(25, y));
        if (y == 33 || y == 34) {
            world.setStructureHits(road, 6000);
        }
    }

    world.addSite(StructureKind::Road, at(24, 20), 300);
    world.addSite(StructureKind::Container, at(10, 37), 5000);
}

void buildBarren(SandboxWorld& world) {
    world.addRoom(kStarterRoom);
    world.addController(at(25, 8), 1, 20000);
    world.addStructure(StructureKind::Spawn, at(25, 25));
    world.addCreep("settler", at(20, 20), {BodyPart::Work, BodyPart::Carry, BodyPart::Move});
}

void buildSiege(SandboxWorld& world, std::mt19937_64& rng) {
    buildStarter(world, rng);
    auto room = world.room(kStarterRoom);
    if (room) {
        for (const auto& s : room->structures) {
            if (s.kind == StructureKind::Tower) {
                world.setStructureEnergy(s.id, 1000);
            }
        }
    }
    world.addHostile(at(2, 2), 300);
    world.addHostile(at(47, 30), 600);
    world.addHostile(at(30, 47), 1500, "Raider");
}
}

std::unique_ptr<SandboxWorld> buildScenario(const std::string& name, std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    auto world = std::make_unique<SandboxWorld>();

    if (name == "barren") {
        buildBarren(*world);
    } else if (name == "siege") {
        buildSiege(*world, rng);
    } else {
        if (name != "starter") {
            spdlog::warn("[Scenario] Unknown scenario '{}', using 'starter'", name);
        }
        buildStarter(*world, rng);
    }
    return world;
}

std::vector<std::string> scenarioNames() {
    return {"starter", "barren", "siege"};
}
