#include "kernel/WorldTypes.h"

#include <algorithm>
#include <cstdlib>

bool operator==(const Position& a, const Position& b) {
    return a.room == b.room && a.x == b.x && a.y == b.y;
}

bool operator!=(const Position& a, const Position& b) {
    return !(a == b);
}

int rangeBetween(const Position& a, const Position& b) {
    if (a.room != b.room) {
        return kUnreachableRange;
    }
    return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));
}

const char* toString(StructureKind kind) {
    switch (kind) {
        case StructureKind::Spawn: return "spawn";
        case StructureKind::Extension: return "extension";
        case StructureKind::Tower: return "tower";
        case StructureKind::Road: return "road";
        case StructureKind::Container: return "container";
        case StructureKind::Wall: return "wall";
        case StructureKind::Rampart: return "rampart";
        case StructureKind::Controller: return "controller";
    }
    return "unknown";
}

std::uint32_t partCost(BodyPart part) {
    switch (part) {
        case BodyPart::Move: return 50;
        case BodyPart::Work: return 100;
        case BodyPart::Carry: return 50;
        case BodyPart::Attack: return 80;
        case BodyPart::RangedAttack: return 150;
        case BodyPart::Heal: return 250;
        case BodyPart::Tough: return 10;
        case BodyPart::Claim: return 600;
    }
    return 0;
}

std::uint32_t loadoutCost(const Loadout& loadout) {
    std::uint32_t total = 0;
    for (auto part : loadout) {
        total += partCost(part);
    }
    return total;
}

const char* toString(BodyPart part) {
    switch (part) {
        case BodyPart::Move: return "move";
        case BodyPart::Work: return "work";
        case BodyPart::Carry: return "carry";
        case BodyPart::Attack: return "attack";
        case BodyPart::RangedAttack: return "ranged_attack";
        case BodyPart::Heal: return "heal";
        case BodyPart::Tough: return "tough";
        case BodyPart::Claim: return "claim";
    }
    return "unknown";
}

std::uint32_t CreepState::countParts(BodyPart part) const {
    return static_cast<std::uint32_t>(std::count(body.begin(), body.end(), part));
}

const char* toString(ActionResult result) {
    switch (result) {
        case ActionResult::Ok: return "OK";
        case ActionResult::NotOwner: return "ERR_NOT_OWNER";
        case ActionResult::NoPath: return "ERR_NO_PATH";
        case ActionResult::NameExists: return "ERR_NAME_EXISTS";
        case ActionResult::Busy: return "ERR_BUSY";
        case ActionResult::NotFound: return "ERR_NOT_FOUND";
        case ActionResult::NotEnoughResources: return "ERR_NOT_ENOUGH_RESOURCES";
        case ActionResult::InvalidTarget: return "ERR_INVALID_TARGET";
        case ActionResult::Full: return "ERR_FULL";
        case ActionResult::NotInRange: return "ERR_NOT_IN_RANGE";
        case ActionResult::InvalidArgs: return "ERR_INVALID_ARGS";
        case ActionResult::Tired: return "ERR_TIRED";
        case ActionResult::NoBodypart: return "ERR_NO_BODYPART";
        case ActionResult::RclNotEnough: return "ERR_RCL_NOT_ENOUGH";
    }
    return "ERR_UNKNOWN";
}
