#include <gtest/gtest.h>
#include "kernel/Kernel.h"
#include "io/Snapshot.h"
#include "world/Scenarios.h"

#include <stdexcept>

namespace {
Position at(int x, int y) {
    return Position{kStarterRoom, x, y};
}

const Loadout kWorker{BodyPart::Work, BodyPart::Carry, BodyPart::Move};

// Host whose harvest call blows up for one creep
class FaultyHarvestWorld : public SandboxWorld {
public:
    ActionResult harvest(const std::string& creep, const std::string& sourceId) override {
        if (creep == "faulty") {
            throw std::runtime_error("host call failed");
        }
        return SandboxWorld::harvest(creep, sourceId);
    }
};

// Host whose tower and spawn calls blow up
class FaultyStructureWorld : public SandboxWorld {
public:
    ActionResult towerAttack(const std::string&, const std::string&) override {
        throw std::runtime_error("host tower call failed");
    }

    ActionResult spawnCreep(const std::string&, const Loadout&, const std::string&) override {
        throw std::runtime_error("host spawn call failed");
    }
};

TickReport tick(Kernel& kernel, SandboxWorld& world, WorkerState& state) {
    TickReport report = kernel.step(world, state);
    world.advance();
    return report;
}
}

// Registry only ever holds one task for a live creep
TEST(KernelTest, SingleTaskPerLiveCreep) {
    KernelConfig cfg;
    Kernel kernel(cfg);
    WorkerState state(cfg.seed);
    auto world = buildScenario("starter", cfg.seed);

    for (int t = 0; t < 200; ++t) {
        tick(kernel, *world, state);
        EXPECT_LE(state.registry.size(), world->creeps().size());
        for (const auto& agent : state.registry.agents()) {
            EXPECT_TRUE(world->creep(agent).has_value()) << agent;
        }
    }
}

// Same seed, same world: same assignments
TEST(KernelTest, DeterministicTicks) {
    KernelConfig cfg;
    cfg.seed = 12345;

    Kernel kernel1(cfg);
    Kernel kernel2(cfg);
    WorkerState state1(cfg.seed);
    WorkerState state2(cfg.seed);
    auto world1 = buildScenario("starter", cfg.seed);
    auto world2 = buildScenario("starter", cfg.seed);

    for (int t = 0; t < 150; ++t) {
        tick(kernel1, *world1, state1);
        tick(kernel2, *world2, state2);
    }

    EXPECT_EQ(registryToJson(state1.registry, world1->time()), registryToJson(state2.registry, world2->time()));
    const auto creeps1 = world1->creeps();
    const auto creeps2 = world2->creeps();
    ASSERT_EQ(creeps1.size(), creeps2.size());
    for (std::size_t i = 0; i < creeps1.size(); ++i) {
        EXPECT_EQ(creeps1[i].name, creeps2[i].name);
        EXPECT_EQ(creeps1[i].pos, creeps2[i].pos);
        EXPECT_EQ(creeps1[i].energy.used, creeps2[i].energy.used);
    }
}

// Nothing to harvest and nothing carried: idle forever, registry untouched
TEST(KernelTest, IdleIsIdempotent) {
    KernelConfig cfg;
    Kernel kernel(cfg);
    WorkerState state(cfg.seed);
    auto world = buildScenario("barren", cfg.seed);

    // Keep the population controller out of it
    auto room = world->room(kStarterRoom);
    ASSERT_TRUE(room.has_value());
    for (const auto& s : room->structures) {
        if (s.kind == StructureKind::Spawn) {
            world->setStructureEnergy(s.id, 0);
        }
    }

    for (int t = 0; t < 10; ++t) {
        const TickReport report = tick(kernel, *world, state);
        EXPECT_TRUE(state.registry.empty());
        EXPECT_EQ(report.agentsProcessed, 1u);
        EXPECT_EQ(report.idleAgents, 1u);
        EXPECT_EQ(report.tasksAssigned, 0u);
        EXPECT_EQ(report.failuresOf(Failure::EmptyCandidateSet), 1u);
        EXPECT_EQ(report.spawnAttempts, 0u);
    }
    EXPECT_EQ(world->creep("settler")->pos, at(20, 20));
    EXPECT_TRUE(world->moveLog().empty());
}

// A task selected this tick is executed from the next tick on
TEST(KernelTest, NewTaskRunsNextTick) {
    SandboxWorld world;
    world.addRoom(kStarterRoom);
    world.addSource(at(10, 10));
    world.addCreep("worker", at(40, 40), kWorker);

    KernelConfig cfg;
    Kernel kernel(cfg);
    WorkerState state(cfg.seed);

    TickReport first = tick(kernel, world, state);
    EXPECT_EQ(first.tasksAssigned, 1u);
    EXPECT_EQ(first.moves, 0u);
    ASSERT_NE(state.registry.find("worker"), nullptr);
    EXPECT_EQ(kindOf(*state.registry.find("worker")), TaskKind::Harvest);

    TickReport second = tick(kernel, world, state);
    EXPECT_EQ(second.tasksAssigned, 0u);
    EXPECT_EQ(second.moves, 1u);
    EXPECT_EQ(world.creep("worker")->pos, at(39, 39));
}

// A full harvester is re-tasked in the same tick it is evicted
TEST(KernelTest, EvictedCreepIsReselectedSameTick) {
    SandboxWorld world;
    world.addRoom(kStarterRoom);
    const std::string controller = world.addController(at(25, 8), 2, 6000);
    world.addSource(at(10, 10));
    world.addCreep("worker", at(11, 10), kWorker);

    KernelConfig cfg;
    Kernel kernel(cfg);
    WorkerState state(cfg.seed);

    tick(kernel, world, state);
    world.setCreepEnergy("worker", 50);

    TickReport report = tick(kernel, world, state);
    EXPECT_EQ(report.tasksEvicted, 1u);
    EXPECT_EQ(report.tasksAssigned, 1u);
    ASSERT_NE(state.registry.find("worker"), nullptr);
    EXPECT_EQ(describe(*state.registry.find("worker")), "upgrade(" + controller + ")");
}

// Dead creeps' entries are dropped unless pruning is disabled
TEST(KernelTest, PrunesDeadAgents) {
    for (bool prune : {true, false}) {
        SandboxWorld world;
        world.addRoom(kStarterRoom);
        world.addSource(at(10, 10));
        world.addCreep("doomed", at(40, 40), kWorker);

        KernelConfig cfg;
        cfg.pruneDeadAgents = prune;
        Kernel kernel(cfg);
        WorkerState state(cfg.seed);

        tick(kernel, world, state);
        ASSERT_EQ(state.registry.size(), 1u);
        ASSERT_TRUE(world.removeCreep("doomed"));

        TickReport report = tick(kernel, world, state);
        EXPECT_EQ(report.agentsProcessed, 0u);
        EXPECT_EQ(report.entriesPruned, prune ? 1u : 0u);
        EXPECT_EQ(state.registry.size(), prune ? 0u : 1u);
    }
}

// One creep's failure never stops the others
TEST(KernelTest, AgentFailureIsContained) {
    FaultyHarvestWorld world;
    world.addRoom(kStarterRoom);
    world.addSource(at(10, 10));
    world.addCreep("faulty", at(11, 10), kWorker);
    world.addCreep("healthy", at(9, 10), kWorker);

    KernelConfig cfg;
    Kernel kernel(cfg);
    WorkerState state(cfg.seed);

    tick(kernel, world, state);
    ASSERT_EQ(state.registry.size(), 2u);

    TickReport report;
    EXPECT_NO_THROW(report = tick(kernel, world, state));
    EXPECT_EQ(report.agentsProcessed, 2u);
    EXPECT_EQ(report.actionsOk, 1u);
    EXPECT_EQ(world.creep("healthy")->energy.used, SandboxRules::kHarvestPerWork);
}

// Spawning creeps are counted but not tasked
TEST(KernelTest, SkipsSpawningCreeps) {
    KernelConfig cfg;
    Kernel kernel(cfg);
    WorkerState state(cfg.seed);
    auto world = buildScenario("starter", cfg.seed);

    TickReport first = tick(kernel, *world, state);
    EXPECT_EQ(first.spawned, 1u);

    TickReport second = tick(kernel, *world, state);
    EXPECT_EQ(second.agentsSpawning, 1u);
    EXPECT_EQ(second.agentsProcessed, 0u);
    EXPECT_TRUE(state.registry.empty());
}

// Worker restart at an arbitrary tick: empty registry, everyone re-selects
TEST(KernelTest, ToleratesRestart) {
    KernelConfig cfg;
    Kernel kernel(cfg);
    WorkerState state(cfg.seed);
    auto world = buildScenario("starter", cfg.seed);

    for (int t = 0; t < 100; ++t) {
        tick(kernel, *world, state);
    }
    ASSERT_FALSE(state.registry.empty());

    state.restart(cfg.seed);
    EXPECT_TRUE(state.registry.empty());
    EXPECT_EQ(state.ticksRun, 0u);

    TickReport report = tick(kernel, *world, state);
    EXPECT_GT(report.agentsProcessed, 0u);
    EXPECT_EQ(report.tasksAssigned + report.idleAgents, report.agentsProcessed);
    EXPECT_EQ(report.tasksEvicted, 0u);
    EXPECT_EQ(state.ticksRun, 1u);
}

// The starter colony harvests, refills its spawn and grows
TEST(KernelTest, StarterColonyGrows) {
    KernelConfig cfg;
    Kernel kernel(cfg);
    WorkerState state(cfg.seed);
    auto world = buildScenario("starter", cfg.seed);

    std::uint32_t spawned = 0;
    std::uint32_t actions = 0;
    for (int t = 0; t < 400; ++t) {
        const TickReport report = tick(kernel, *world, state);
        spawned += report.spawned;
        actions += report.actionsOk;
    }

    EXPECT_GE(spawned, 2u);
    EXPECT_GE(world->creeps().size(), 2u);
    EXPECT_GT(actions, 0u);
    EXPECT_EQ(kernel.lastReport().tick, world->time() - 1);
}

// Towers answer the siege before any creep moves
TEST(KernelTest, SiegeTowersFire) {
    KernelConfig cfg;
    Kernel kernel(cfg);
    WorkerState state(cfg.seed);
    auto world = buildScenario("siege", cfg.seed);

    const TickReport report = tick(kernel, *world, state);
    // The closest invader is too sturdy to drop in one shot
    EXPECT_EQ(report.towerAttacks, 1u);
    EXPECT_EQ(world->hostileCount(), 3u);
}

// A bad config is rejected without touching the running kernel
TEST(KernelTest, ResetRejectsBadConfig) {
    KernelConfig cfg;
    Kernel kernel(cfg);

    KernelConfig bad = cfg;
    bad.selector.repairFactor = 2.0;
    EXPECT_THROW(kernel.reset(bad), std::invalid_argument);
    EXPECT_DOUBLE_EQ(kernel.config().selector.repairFactor, 0.75);
    EXPECT_DOUBLE_EQ(kernel.selector().policy().repairFactor, 0.75);

    KernelConfig other = cfg;
    other.seed = 7;
    other.executor.reusePath[static_cast<std::size_t>(TaskKind::Upgrade)] = 25;
    other.population.rows.pop_back();
    kernel.reset(other);
    EXPECT_EQ(kernel.config().seed, 7u);
    EXPECT_EQ(kernel.executor().reuseHint(TaskKind::Upgrade), 25u);
    EXPECT_EQ(kernel.population().maxPopulation(), 8u);
}

// Host failures in defense and population stay inside their step
TEST(KernelTest, StructureFailuresAreContained) {
    FaultyStructureWorld world;
    world.addRoom(kStarterRoom);
    const std::string tower = world.addStructure(StructureKind::Tower, at(28, 23));
    world.setStructureEnergy(tower, 1000);
    world.addStructure(StructureKind::Spawn, at(25, 25));
    world.addHostile(at(30, 30), 300);
    world.addSource(at(10, 10));
    world.addCreep("worker", at(40, 40), kWorker);

    KernelConfig cfg;
    Kernel kernel(cfg);
    WorkerState state(cfg.seed);

    TickReport report;
    EXPECT_NO_THROW(report = tick(kernel, world, state));
    EXPECT_EQ(report.towerAttacks, 0u);
    EXPECT_EQ(report.agentsProcessed, 1u);
    EXPECT_EQ(report.tasksAssigned, 1u);
    ASSERT_NE(state.registry.find("worker"), nullptr);
    EXPECT_EQ(kindOf(*state.registry.find("worker")), TaskKind::Harvest);

    EXPECT_EQ(report.spawnAttempts, 1u);
    EXPECT_EQ(report.spawned, 0u);
    EXPECT_EQ(report.failuresOf(Failure::CreationRejected), 1u);
    EXPECT_EQ(world.hostileCount(), 1u);
}
