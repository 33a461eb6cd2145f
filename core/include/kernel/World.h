#ifndef WORLD_H
#define WORLD_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "kernel/WorldTypes.h"

/**
 * Host world seen by the engine.
 *
 * Everything returned here is a value snapshot valid for the current tick
 * only. Task state never stores these values; it stores ids and resolves
 * them again next tick (see kernel/Resolver.h).
 */
class World {
public:
    virtual ~World() = default;

    // Clock
    virtual std::uint64_t time() const = 0;
    virtual double cpuUsed() const = 0;

    // Snapshot queries
    virtual std::vector<std::string> roomNames() const = 0;
    virtual std::optional<RoomSnapshot> room(const std::string& name) const = 0;
    virtual std::vector<CreepState> creeps() const = 0;
    virtual Terrain terrainAt(const Position& pos) const = 0;

    // Lookups by stable id; nullopt when the object no longer exists
    virtual std::optional<ControllerState> controller(const std::string& id) const = 0;
    virtual std::optional<SourceState> source(const std::string& id) const = 0;
    virtual std::optional<ConstructionSiteState> constructionSite(const std::string& id) const = 0;
    virtual std::optional<StructureState> structure(const std::string& id) const = 0;

    // Creep directives
    virtual ActionResult moveTo(const std::string& creep, const Position& target, std::uint32_t reusePath) = 0;
    virtual ActionResult harvest(const std::string& creep, const std::string& sourceId) = 0;
    virtual ActionResult build(const std::string& creep, const std::string& siteId) = 0;
    virtual ActionResult transfer(const std::string& creep, const std::string& targetId, ResourceKind resource) = 0;
    virtual ActionResult repair(const std::string& creep, const std::string& structureId) = 0;
    virtual ActionResult upgradeController(const std::string& creep, const std::string& controllerId) = 0;

    // Structure directives
    virtual ActionResult towerAttack(const std::string& towerId, const std::string& hostileId) = 0;
    virtual ActionResult spawnCreep(const std::string& spawnId, const Loadout& body, const std::string& name) = 0;
};

#endif
