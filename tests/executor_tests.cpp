#include <gtest/gtest.h>
#include "modules/TaskExecutor.h"
#include "world/SandboxWorld.h"

#include <memory>
#include <sstream>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

namespace {
Position at(int x, int y) {
    return Position{"W1N1", x, y};
}

const Loadout kWorker{BodyPart::Work, BodyPart::Carry, BodyPart::Move};

// Host that always claims the harvest target is too far, and counts moves
class FarHarvestWorld : public SandboxWorld {
public:
    ActionResult harvest(const std::string&, const std::string&) override {
        return ActionResult::NotInRange;
    }

    ActionResult moveTo(const std::string& creep, const Position& target, std::uint32_t reusePath) override {
        moveCalls++;
        return SandboxWorld::moveTo(creep, target, reusePath);
    }

    int moveCalls = 0;
};

std::uint32_t totalFailures(const TickReport& report) {
    std::uint32_t total = 0;
    for (auto count : report.failures) {
        total += count;
    }
    return total;
}
}

// Referent vanished: evict without acting or moving
TEST(ExecutorTest, MissingReferentEvicts) {
    SandboxWorld world;
    world.addRoom("W1N1");
    const std::string source = world.addSource(at(10, 10));
    world.addCreep("worker", at(11, 10), kWorker);

    TaskRegistry registry;
    auto entry = registry.entry("worker");
    entry.insert(HarvestTask{SourceRef{source}});
    ASSERT_TRUE(world.removeObject(source));

    TaskExecutor executor;
    TickReport report;
    const TaskOutcome outcome = executor.execute(world, *world.creep("worker"), entry, report);

    EXPECT_EQ(outcome, TaskOutcome::Evicted);
    EXPECT_TRUE(entry.vacant());
    EXPECT_EQ(report.failuresOf(Failure::ReferentGone), 1u);
    EXPECT_EQ(report.tasksEvicted, 1u);
    EXPECT_EQ(report.moves, 0u);
    EXPECT_TRUE(world.moveLog().empty());
}

// Out of range: one step toward the target with the harvest reuse hint
TEST(ExecutorTest, OutOfRangeMovesAndKeepsTask) {
    SandboxWorld world;
    world.addRoom("W1N1");
    const std::string source = world.addSource(at(10, 10));
    world.addCreep("worker", at(40, 40), kWorker);

    TaskRegistry registry;
    auto entry = registry.entry("worker");
    entry.insert(HarvestTask{SourceRef{source}});

    TaskExecutor executor;
    TickReport report;
    const TaskOutcome outcome = executor.execute(world, *world.creep("worker"), entry, report);

    EXPECT_EQ(outcome, TaskOutcome::Moved);
    ASSERT_TRUE(entry.occupied());
    EXPECT_TRUE(std::get<HarvestTask>(entry.task()) == HarvestTask{SourceRef{source}});
    EXPECT_EQ(report.moves, 1u);
    EXPECT_EQ(report.actionsOk, 0u);

    ASSERT_EQ(world.moveLog().size(), 1u);
    EXPECT_EQ(world.moveLog().front().reusePath, executor.reuseHint(TaskKind::Harvest));
    EXPECT_EQ(world.moveLog().front().target, at(10, 10));
    EXPECT_EQ(world.creep("worker")->pos, at(39, 39));
}

// Host says NotInRange despite adjacency: keep the task, move exactly once
TEST(ExecutorTest, HostRangeDisagreementFallsThroughToMove) {
    FarHarvestWorld world;
    world.addRoom("W1N1");
    const std::string source = world.addSource(at(10, 10));
    world.addCreep("worker", at(11, 10), kWorker);

    TaskRegistry registry;
    auto entry = registry.entry("worker");
    entry.insert(HarvestTask{SourceRef{source}});

    TaskExecutor executor;
    TickReport report;
    const TaskOutcome outcome = executor.execute(world, *world.creep("worker"), entry, report);

    EXPECT_EQ(outcome, TaskOutcome::Moved);
    ASSERT_TRUE(entry.occupied());
    EXPECT_TRUE(std::get<HarvestTask>(entry.task()) == HarvestTask{SourceRef{source}});
    EXPECT_EQ(world.moveCalls, 1);
    EXPECT_EQ(report.moves, 1u);
    EXPECT_EQ(report.failuresOf(Failure::OutOfRange), 1u);
    EXPECT_EQ(report.failuresOf(Failure::ActionRejected), 0u);
    EXPECT_EQ(report.tasksEvicted, 0u);
}

// In range: the action runs and the task persists
TEST(ExecutorTest, InRangeActs) {
    SandboxWorld world;
    world.addRoom("W1N1");
    const std::string source = world.addSource(at(10, 10));
    world.addCreep("worker", at(11, 11), kWorker);

    TaskRegistry registry;
    auto entry = registry.entry("worker");
    entry.insert(HarvestTask{SourceRef{source}});

    TaskExecutor executor;
    TickReport report;
    const TaskOutcome outcome = executor.execute(world, *world.creep("worker"), entry, report);

    EXPECT_EQ(outcome, TaskOutcome::Acted);
    EXPECT_TRUE(entry.occupied());
    EXPECT_EQ(report.actionsOk, 1u);
    EXPECT_EQ(report.moves, 0u);
    EXPECT_EQ(world.creep("worker")->energy.used, SandboxRules::kHarvestPerWork);
    EXPECT_EQ(world.source(source)->energy, SandboxRules::kSourceCapacity - SandboxRules::kHarvestPerWork);
}

// Guards against the creep's load: full harvester, empty upgrader
TEST(ExecutorTest, StaleTasksAreEvicted) {
    SandboxWorld world;
    world.addRoom("W1N1");
    const std::string controller = world.addController(at(25, 8), 2, 6000);
    const std::string source = world.addSource(at(10, 10));
    world.addCreep("full", at(11, 10), kWorker, 50);
    world.addCreep("empty", at(25, 9), kWorker, 0);

    TaskRegistry registry;
    registry.entry("full").insert(HarvestTask{SourceRef{source}});
    registry.entry("empty").insert(UpgradeTask{ControllerRef{controller}});

    TaskExecutor executor;
    TickReport report;
    auto full = registry.entry("full");
    auto empty = registry.entry("empty");
    EXPECT_EQ(executor.execute(world, *world.creep("full"), full, report), TaskOutcome::Evicted);
    EXPECT_EQ(executor.execute(world, *world.creep("empty"), empty, report), TaskOutcome::Evicted);

    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(report.tasksEvicted, 2u);
    EXPECT_EQ(totalFailures(report), 0u);
    EXPECT_EQ(report.actionsOk, 0u);
    EXPECT_EQ(world.source(source)->energy, SandboxRules::kSourceCapacity);
}

// One successful repair vacates the entry
TEST(ExecutorTest, RepairIsSingleShot) {
    SandboxWorld world;
    world.addRoom("W1N1");
    const std::string road = world.addStructure(StructureKind::Road, at(12, 12));
    world.setStructureHits(road, 1000);
    world.addCreep("worker", at(12, 14), kWorker, 50);

    TaskRegistry registry;
    auto entry = registry.entry("worker");
    entry.insert(RepairTask{StructureRef{road}});

    TaskExecutor executor;
    TickReport report;
    const TaskOutcome outcome = executor.execute(world, *world.creep("worker"), entry, report);

    EXPECT_EQ(outcome, TaskOutcome::Completed);
    EXPECT_TRUE(entry.vacant());
    EXPECT_EQ(report.tasksCompleted, 1u);
    EXPECT_EQ(report.tasksEvicted, 0u);
    EXPECT_EQ(report.actionsOk, 1u);
    EXPECT_EQ(world.structure(road)->hits, 1000u + SandboxRules::kRepairHitsPerWork);
    EXPECT_EQ(world.creep("worker")->energy.used, 49u);
}

// Repair out of range moves and keeps the task
TEST(ExecutorTest, DistantRepairKeepsTask) {
    SandboxWorld world;
    world.addRoom("W1N1");
    const std::string road = world.addStructure(StructureKind::Road, at(12, 12));
    world.setStructureHits(road, 1000);
    world.addCreep("worker", at(12, 30), kWorker, 50);

    TaskRegistry registry;
    auto entry = registry.entry("worker");
    entry.insert(RepairTask{StructureRef{road}});

    TaskExecutor executor;
    TickReport report;
    EXPECT_EQ(executor.execute(world, *world.creep("worker"), entry, report), TaskOutcome::Moved);
    EXPECT_TRUE(entry.occupied());
    EXPECT_EQ(report.tasksCompleted, 0u);
    ASSERT_EQ(world.moveLog().size(), 1u);
    EXPECT_EQ(world.moveLog().front().reusePath, executor.reuseHint(TaskKind::Repair));
}

// Any other action failure is logged and evicts
TEST(ExecutorTest, RejectedActionEvicts) {
    SandboxWorld world;
    world.addRoom("W1N1");
    const std::string extension = world.addStructure(StructureKind::Extension, at(20, 20));
    world.setStructureEnergy(extension, 50);
    world.addCreep("worker", at(21, 20), kWorker, 50);

    TaskRegistry registry;
    auto entry = registry.entry("worker");
    entry.insert(StoreTask{ExtensionRef{extension}});

    TaskExecutor executor;
    TickReport report;
    const TaskOutcome outcome = executor.execute(world, *world.creep("worker"), entry, report);

    EXPECT_EQ(outcome, TaskOutcome::Evicted);
    EXPECT_TRUE(entry.vacant());
    EXPECT_EQ(report.failuresOf(Failure::ActionRejected), 1u);
    EXPECT_EQ(report.tasksEvicted, 1u);
    EXPECT_EQ(report.moves, 0u);
}

// Transfer into a store that has room
TEST(ExecutorTest, StoreTransfersEnergy) {
    SandboxWorld world;
    world.addRoom("W1N1");
    const std::string tower = world.addStructure(StructureKind::Tower, at(20, 20));
    world.addCreep("worker", at(21, 21), kWorker, 50);

    TaskRegistry registry;
    auto entry = registry.entry("worker");
    entry.insert(StoreTask{TowerRef{tower}});

    TaskExecutor executor;
    TickReport report;
    EXPECT_EQ(executor.execute(world, *world.creep("worker"), entry, report), TaskOutcome::Acted);
    EXPECT_TRUE(entry.occupied());
    EXPECT_EQ(world.structure(tower)->energy->used, 50u);
    EXPECT_EQ(world.creep("worker")->energy.used, 0u);
}

// A store ref naming a structure of another kind no longer resolves
TEST(ExecutorTest, StoreKindMismatchIsReferentGone) {
    SandboxWorld world;
    world.addRoom("W1N1");
    const std::string tower = world.addStructure(StructureKind::Tower, at(20, 20));
    world.addCreep("worker", at(21, 21), kWorker, 50);

    TaskRegistry registry;
    auto entry = registry.entry("worker");
    entry.insert(StoreTask{ExtensionRef{tower}});

    TaskExecutor executor;
    TickReport report;
    EXPECT_EQ(executor.execute(world, *world.creep("worker"), entry, report), TaskOutcome::Evicted);
    EXPECT_EQ(report.failuresOf(Failure::ReferentGone), 1u);
}

// Upgrade uses the ranged check and the long reuse hint
TEST(ExecutorTest, UpgradeRangeAndHint) {
    SandboxWorld world;
    world.addRoom("W1N1");
    const std::string controller = world.addController(at(25, 8), 2, 6000);
    world.addCreep("near", at(25, 11), kWorker, 10);
    world.addCreep("far", at(25, 12), kWorker, 10);

    TaskRegistry registry;
    registry.entry("near").insert(UpgradeTask{ControllerRef{controller}});
    registry.entry("far").insert(UpgradeTask{ControllerRef{controller}});

    TaskExecutor executor;
    TickReport report;
    auto nearEntry = registry.entry("near");
    auto farEntry = registry.entry("far");
    EXPECT_EQ(executor.execute(world, *world.creep("near"), nearEntry, report), TaskOutcome::Acted);
    EXPECT_EQ(executor.execute(world, *world.creep("far"), farEntry, report), TaskOutcome::Moved);

    EXPECT_EQ(world.controller(controller)->progress, 1u);
    ASSERT_EQ(world.moveLog().size(), 1u);
    EXPECT_EQ(world.moveLog().front().reusePath, 50u);
    EXPECT_EQ(TaskExecutor::actionRange(TaskKind::Upgrade), kRangedRange);
    EXPECT_EQ(TaskExecutor::actionRange(TaskKind::Store), kContactRange);
}

// Build in range keeps the task; the finished site is gone next tick
TEST(ExecutorTest, ConstructUntilSiteCompletes) {
    SandboxWorld world;
    world.addRoom("W1N1");
    const std::string site = world.addSite(StructureKind::Road, at(10, 10), 10);
    world.addCreep("builder", at(13, 10), kWorker, 50);
    world.addCreep("distant", at(20, 10), kWorker, 50);

    TaskRegistry registry;
    registry.entry("builder").insert(ConstructTask{SiteRef{site}});
    registry.entry("distant").insert(ConstructTask{SiteRef{site}});
    auto builder = registry.entry("builder");
    auto distant = registry.entry("distant");

    TaskExecutor executor;
    TickReport report;

    // Out of range: walk with the construct reuse hint
    EXPECT_EQ(executor.execute(world, *world.creep("distant"), distant, report), TaskOutcome::Moved);
    EXPECT_TRUE(distant.occupied());
    ASSERT_EQ(world.moveLog().size(), 1u);
    EXPECT_EQ(world.moveLog().front().reusePath, 15u);
    EXPECT_EQ(executor.reuseHint(TaskKind::Construct), 15u);
    world.clearMoveLog();

    // Range 3 is close enough to build
    EXPECT_EQ(executor.execute(world, *world.creep("builder"), builder, report), TaskOutcome::Acted);
    EXPECT_TRUE(builder.occupied());
    EXPECT_EQ(world.constructionSite(site)->progress, SandboxRules::kBuildPerWork);

    EXPECT_EQ(executor.execute(world, *world.creep("builder"), builder, report), TaskOutcome::Acted);
    EXPECT_FALSE(world.constructionSite(site).has_value());
    EXPECT_EQ(report.actionsOk, 2u);

    EXPECT_EQ(executor.execute(world, *world.creep("builder"), builder, report), TaskOutcome::Evicted);
    EXPECT_TRUE(builder.vacant());
    EXPECT_EQ(report.failuresOf(Failure::ReferentGone), 1u);
    EXPECT_TRUE(world.moveLog().empty());
}

// An emptied carrier ending its delivery is not a warning; a full target is
TEST(ExecutorTest, EmptiedCarrierLogsAtDebug) {
    SandboxWorld world;
    world.addRoom("W1N1");
    const std::string tower = world.addStructure(StructureKind::Tower, at(20, 20));
    const std::string extension = world.addStructure(StructureKind::Extension, at(30, 30));
    world.setStructureEnergy(extension, 50);
    world.addCreep("emptied", at(21, 21), kWorker, 0);
    world.addCreep("blocked", at(31, 31), kWorker, 50);

    TaskRegistry registry;
    registry.entry("emptied").insert(StoreTask{TowerRef{tower}});
    registry.entry("blocked").insert(StoreTask{ExtensionRef{extension}});
    auto emptied = registry.entry("emptied");
    auto blocked = registry.entry("blocked");

    std::ostringstream captured;
    auto logger = std::make_shared<spdlog::logger>(
        "executor-capture", std::make_shared<spdlog::sinks::ostream_sink_mt>(captured));
    logger->set_pattern("%l|%v");
    logger->set_level(spdlog::level::trace);
    auto previous = spdlog::default_logger();
    spdlog::set_default_logger(logger);

    TaskExecutor executor;
    TickReport report;
    const TaskOutcome first = executor.execute(world, *world.creep("emptied"), emptied, report);
    const std::string emptiedLog = captured.str();
    captured.str("");
    const TaskOutcome second = executor.execute(world, *world.creep("blocked"), blocked, report);
    const std::string blockedLog = captured.str();

    spdlog::set_default_logger(previous);

    EXPECT_EQ(first, TaskOutcome::Evicted);
    EXPECT_EQ(second, TaskOutcome::Evicted);
    EXPECT_EQ(report.failuresOf(Failure::ActionRejected), 2u);
    EXPECT_NE(emptiedLog.find("debug|[Executor] emptied"), std::string::npos);
    EXPECT_EQ(emptiedLog.find("warning|"), std::string::npos);
    EXPECT_NE(blockedLog.find("warning|[Executor] blocked"), std::string::npos);
}
