#ifndef WORLD_TYPES_H
#define WORLD_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ---------- Geometry ----------
struct Position {
    std::string room;
    int x = 0;
    int y = 0;
};

bool operator==(const Position& a, const Position& b);
bool operator!=(const Position& a, const Position& b);

// Chebyshev distance; positions in different rooms are never in range.
constexpr int kUnreachableRange = 1 << 20;
int rangeBetween(const Position& a, const Position& b);

enum class Terrain : std::uint8_t {
    Plain = 0,
    Swamp = 1,
    Wall = 2,
    COUNT
};

// ---------- Resources ----------
enum class ResourceKind : std::uint8_t {
    Energy = 0
};

// Used/free amount of a single resource kind
struct Capacity {
    std::uint32_t used = 0;
    std::uint32_t capacity = 0;

    std::uint32_t free() const { return capacity > used ? capacity - used : 0; }
};

// ---------- Structures ----------
enum class StructureKind : std::uint8_t {
    Spawn,
    Extension,
    Tower,
    Road,
    Container,
    Wall,
    Rampart,
    Controller
};

const char* toString(StructureKind kind);

struct StructureState {
    std::string id;
    StructureKind kind = StructureKind::Road;
    Position pos;
    bool my = false;
    std::uint32_t hits = 0;
    std::uint32_t hitsMax = 0;
    std::optional<Capacity> energy;  // present only for structures with a store
};

struct ControllerState {
    std::string id;
    Position pos;
    bool my = false;
    int level = 0;
    std::uint32_t ticksToDowngrade = 0;
    std::uint32_t progress = 0;
};

struct SourceState {
    std::string id;
    Position pos;
    std::uint32_t energy = 0;
    std::uint32_t energyCapacity = 0;
};

struct ConstructionSiteState {
    std::string id;
    Position pos;
    bool my = true;
    StructureKind kind = StructureKind::Road;
    std::uint32_t progress = 0;
    std::uint32_t progressTotal = 0;
};

struct HostileState {
    std::string id;
    Position pos;
    std::string owner;
    std::uint32_t hits = 0;
};

// ---------- Agents ----------
enum class BodyPart : std::uint8_t {
    Move,
    Work,
    Carry,
    Attack,
    RangedAttack,
    Heal,
    Tough,
    Claim
};

using Loadout = std::vector<BodyPart>;

std::uint32_t partCost(BodyPart part);
std::uint32_t loadoutCost(const Loadout& loadout);
const char* toString(BodyPart part);

struct CreepState {
    std::string name;
    Position pos;
    bool spawning = false;
    Capacity energy;
    Loadout body;

    std::uint32_t countParts(BodyPart part) const;
};

// ---------- Rooms ----------
struct RoomSnapshot {
    std::string name;
    std::optional<ControllerState> controller;
    std::vector<StructureState> structures;
    std::vector<ConstructionSiteState> sites;
    std::vector<SourceState> activeSources;  // sources with energy > 0
    std::vector<HostileState> hostiles;
    std::uint32_t energyAvailable = 0;
    std::uint32_t energyCapacityAvailable = 0;
};

// ---------- Action outcomes ----------
// Mirrors the host game's return codes
enum class ActionResult : std::int8_t {
    Ok = 0,
    NotOwner = -1,
    NoPath = -2,
    NameExists = -3,
    Busy = -4,
    NotFound = -5,
    NotEnoughResources = -6,
    InvalidTarget = -7,
    Full = -8,
    NotInRange = -9,
    InvalidArgs = -10,
    Tired = -11,
    NoBodypart = -12,
    RclNotEnough = -14
};

const char* toString(ActionResult result);

#endif
