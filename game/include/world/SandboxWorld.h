#ifndef GAME_SANDBOX_WORLD_H
#define GAME_SANDBOX_WORLD_H

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "kernel/World.h"

constexpr int kRoomSize = 50;

// Host game rules used by the sandbox
namespace SandboxRules {
    constexpr std::uint32_t kHarvestPerWork = 2;
    constexpr std::uint32_t kBuildPerWork = 5;
    constexpr std::uint32_t kRepairHitsPerWork = 100;
    constexpr std::uint32_t kUpgradePerWork = 1;
    constexpr std::uint32_t kCarryCapacity = 50;
    constexpr std::uint32_t kSpawnTicksPerPart = 3;
    constexpr std::uint32_t kMaxBodyParts = 50;

    constexpr std::uint32_t kSourceCapacity = 3000;
    constexpr std::uint32_t kSourceRegenTicks = 300;

    constexpr std::uint32_t kRoadDecayInterval = 1000;
    constexpr std::uint32_t kRoadDecayAmount = 100;

    constexpr std::uint32_t kTowerEnergyCost = 10;
    constexpr std::uint32_t kTowerPowerAttack = 600;
    constexpr std::uint32_t kTowerFalloffAttack = 150;
    constexpr int kTowerOptimalRange = 5;
    constexpr int kTowerFalloffRange = 20;

    // Indexed by controller level; index 0 unused
    constexpr std::array<std::uint32_t, 9> kControllerDowngrade{
        0, 20000, 10000, 20000, 40000, 80000, 120000, 150000, 200000};
    constexpr std::array<std::uint32_t, 9> kControllerLevelProgress{
        0, 200, 45000, 135000, 405000, 1215000, 3645000, 10935000, 0};

    // Road hits multiply by the terrain under the road
    constexpr std::uint32_t kRoadHits = 5000;
    constexpr std::uint32_t kSwampRoadFactor = 5;
    constexpr std::uint32_t kWallRoadFactor = 150;

    std::uint32_t roadHitsMax(Terrain terrain);
    std::uint32_t towerDamage(int range);
}

// One directive issued through moveTo, kept for inspection
struct MoveRecord {
    std::uint64_t tick = 0;
    std::string creep;
    Position target;
    std::uint32_t reusePath = 0;
};

/**
 * Deterministic in-memory host world.
 *
 * Actions apply immediately; advance() closes the tick (clock, source
 * regeneration, controller countdown, road decay, spawning). Objects keep
 * insertion order, which is also the order room snapshots list them in.
 */
class SandboxWorld : public World {
public:
    explicit SandboxWorld(std::uint64_t startTick = 1);

    // ---- World ----
    std::uint64_t time() const override { return tick_; }
    double cpuUsed() const override;

    std::vector<std::string> roomNames() const override;
    std::optional<RoomSnapshot> room(const std::string& name) const override;
    std::vector<CreepState> creeps() const override;
    Terrain terrainAt(const Position& pos) const override;

    std::optional<ControllerState> controller(const std::string& id) const override;
    std::optional<SourceState> source(const std::string& id) const override;
    std::optional<ConstructionSiteState> constructionSite(const std::string& id) const override;
    std::optional<StructureState> structure(const std::string& id) const override;

    ActionResult moveTo(const std::string& creep, const Position& target, std::uint32_t reusePath) override;
    ActionResult harvest(const std::string& creep, const std::string& sourceId) override;
    ActionResult build(const std::string& creep, const std::string& siteId) override;
    ActionResult transfer(const std::string& creep, const std::string& targetId, ResourceKind resource) override;
    ActionResult repair(const std::string& creep, const std::string& structureId) override;
    ActionResult upgradeController(const std::string& creep, const std::string& controllerId) override;
    ActionResult towerAttack(const std::string& towerId, const std::string& hostileId) override;
    ActionResult spawnCreep(const std::string& spawnId, const Loadout& body, const std::string& name) override;

    // ---- Scenario building ----
    void addRoom(const std::string& name);
    void setTerrain(const Position& pos, Terrain terrain);
    std::string addController(const Position& pos, int level, std::uint32_t ticksToDowngrade, bool my = true);
    std::string addSource(const Position& pos, std::uint32_t energy = SandboxRules::kSourceCapacity);
    std::string addStructure(StructureKind kind, const Position& pos, bool my = true);
    std::string addSite(StructureKind kind, const Position& pos, std::uint32_t progressTotal = 300);
    std::string addHostile(const Position& pos, std::uint32_t hits = 100, const std::string& owner = "Invader");
    void addCreep(const std::string& name, const Position& pos, const Loadout& body, std::uint32_t energy = 0);

    // ---- Direct manipulation ----
    bool removeObject(const std::string& id);
    bool removeCreep(const std::string& name);
    void setCreepEnergy(const std::string& name, std::uint32_t energy);
    void setCreepPosition(const std::string& name, const Position& pos);
    void setStructureHits(const std::string& id, std::uint32_t hits);
    void setStructureEnergy(const std::string& id, std::uint32_t energy);
    void setSourceEnergy(const std::string& id, std::uint32_t energy);
    void setControllerDowngrade(const std::string& id, std::uint32_t ticksToDowngrade);

    // ---- Tick ----
    void advance();

    // ---- Inspection ----
    std::optional<CreepState> creep(const std::string& name) const;
    const std::vector<MoveRecord>& moveLog() const { return moveLog_; }
    void clearMoveLog() { moveLog_.clear(); }
    std::size_t hostileCount() const { return hostiles_.size(); }

private:
    struct RoomData {
        std::string name;
        std::array<Terrain, kRoomSize * kRoomSize> terrain{};
    };

    struct SandboxCreep {
        CreepState state;
        std::string spawnId;  // spawn producing it while spawnTicksLeft > 0
        std::uint32_t spawnTicksLeft = 0;
    };

    struct SandboxSource {
        SourceState state;
        std::uint32_t ticksToRegeneration = 0;
    };

    std::uint64_t tick_;
    std::uint64_t nextId_ = 1;
    std::chrono::steady_clock::time_point tickStart_;

    std::vector<RoomData> rooms_;
    std::vector<ControllerState> controllers_;
    std::vector<SandboxSource> sources_;
    std::vector<StructureState> structures_;
    std::vector<ConstructionSiteState> sites_;
    std::vector<HostileState> hostiles_;
    std::vector<SandboxCreep> creeps_;
    std::vector<MoveRecord> moveLog_;

    std::string makeId(const char* prefix);
    void requireRoom(const Position& pos) const;
    const RoomData* findRoom(const std::string& name) const;

    SandboxCreep* findCreep(const std::string& name);
    const SandboxCreep* findCreep(const std::string& name) const;
    ControllerState* findController(const std::string& id);
    SandboxSource* findSource(const std::string& id);
    StructureState* findStructure(const std::string& id);
    ConstructionSiteState* findSite(const std::string& id);
    HostileState* findHostile(const std::string& id);

    // NotFound / Busy / NoBodypart / Ok for a creep about to act
    ActionResult checkActor(const SandboxCreep* creep, BodyPart required) const;

    StructureState makeStructure(StructureKind kind, const Position& pos, bool my) const;
    bool spawnIsBusy(const std::string& spawnId) const;
    std::uint32_t roomEnergy(const std::string& room, bool capacity) const;
    void spendRoomEnergy(const std::string& room, std::uint32_t amount);
};

#endif
