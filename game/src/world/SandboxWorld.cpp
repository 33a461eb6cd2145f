#include "world/SandboxWorld.h"

#include <algorithm>
#include <stdexcept>

namespace {
template <typename T, typename Pred>
T* findIn(std::vector<T>& items, Pred pred) {
    auto it = std::find_if(items.begin(), items.end(), pred);
    return (it != items.end()) ? &(*it) : nullptr;
}

int stepToward(int from, int to) {
    return (to > from) ? 1 : (to < from ? -1 : 0);
}
}

// ---------- Rules ----------
std::uint32_t SandboxRules::roadHitsMax(Terrain terrain) {
    switch (terrain) {
        case Terrain::Swamp: return kRoadHits * kSwampRoadFactor;
        case Terrain::Wall: return kRoadHits * kWallRoadFactor;
        default: return kRoadHits;
    }
}

std::uint32_t SandboxRules::towerDamage(int range) {
    if (range <= kTowerOptimalRange) return kTowerPowerAttack;
    if (range >= kTowerFalloffRange) return kTowerFalloffAttack;
    const auto falloff = static_cast<std::uint32_t>(range - kTowerOptimalRange) *
                         (kTowerPowerAttack - kTowerFalloffAttack) /
                         static_cast<std::uint32_t>(kTowerFalloffRange - kTowerOptimalRange);
    return kTowerPowerAttack - falloff;
}

SandboxWorld::SandboxWorld(std::uint64_t startTick)
    : tick_(startTick), tickStart_(std::chrono::steady_clock::now()) {}

double SandboxWorld::cpuUsed() const {
    const auto elapsed = std::chrono::steady_clock::now() - tickStart_;
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

// ---------- Queries ----------
std::vector<std::string> SandboxWorld::roomNames() const {
    std::vector<std::string> names;
    names.reserve(rooms_.size());
    for (const auto& r : rooms_) {
        names.push_back(r.name);
    }
    return names;
}

std::optional<RoomSnapshot> SandboxWorld::room(const std::string& name) const {
    if (!findRoom(name)) {
        return std::nullopt;
    }

    RoomSnapshot snap;
    snap.name = name;
    for (const auto& c : controllers_) {
        if (c.pos.room == name) {
            snap.controller = c;
            break;
        }
    }
    for (const auto& s : structures_) {
        if (s.pos.room == name) snap.structures.push_back(s);
    }
    for (const auto& site : sites_) {
        if (site.pos.room == name) snap.sites.push_back(site);
    }
    for (const auto& src : sources_) {
        if (src.state.pos.room == name && src.state.energy > 0) snap.activeSources.push_back(src.state);
    }
    for (const auto& h : hostiles_) {
        if (h.pos.room == name) snap.hostiles.push_back(h);
    }
    snap.energyAvailable = roomEnergy(name, false);
    snap.energyCapacityAvailable = roomEnergy(name, true);
    return snap;
}

std::vector<CreepState> SandboxWorld::creeps() const {
    std::vector<CreepState> out;
    out.reserve(creeps_.size());
    for (const auto& c : creeps_) {
        out.push_back(c.state);
    }
    return out;
}

Terrain SandboxWorld::terrainAt(const Position& pos) const {
    const RoomData* r = findRoom(pos.room);
    if (!r || pos.x < 0 || pos.x >= kRoomSize || pos.y < 0 || pos.y >= kRoomSize) {
        return Terrain::Wall;
    }
    return r->terrain[static_cast<std::size_t>(pos.y * kRoomSize + pos.x)];
}

std::optional<ControllerState> SandboxWorld::controller(const std::string& id) const {
    for (const auto& c : controllers_) {
        if (c.id == id) return c;
    }
    return std::nullopt;
}

std::optional<SourceState> SandboxWorld::source(const std::string& id) const {
    for (const auto& s : sources_) {
        if (s.state.id == id) return s.state;
    }
    return std::nullopt;
}

std::optional<ConstructionSiteState> SandboxWorld::constructionSite(const std::string& id) const {
    for (const auto& s : sites_) {
        if (s.id == id) return s;
    }
    return std::nullopt;
}

std::optional<StructureState> SandboxWorld::structure(const std::string& id) const {
    for (const auto& s : structures_) {
        if (s.id == id) return s;
    }
    return std::nullopt;
}

std::optional<CreepState> SandboxWorld::creep(const std::string& name) const {
    const SandboxCreep* c = findCreep(name);
    if (!c) return std::nullopt;
    return c->state;
}

// ---------- Creep directives ----------
ActionResult SandboxWorld::moveTo(const std::string& creep, const Position& target, std::uint32_t reusePath) {
    SandboxCreep* c = findCreep(creep);
    const ActionResult check = checkActor(c, BodyPart::Move);
    if (check != ActionResult::Ok) return check;

    moveLog_.push_back({tick_, creep, target, reusePath});

    auto& pos = c->state.pos;
    if (pos.room != target.room) {
        return ActionResult::NoPath;
    }
    pos.x += stepToward(pos.x, target.x);
    pos.y += stepToward(pos.y, target.y);
    return ActionResult::Ok;
}

ActionResult SandboxWorld::harvest(const std::string& creep, const std::string& sourceId) {
    SandboxCreep* c = findCreep(creep);
    const ActionResult check = checkActor(c, BodyPart::Work);
    if (check != ActionResult::Ok) return check;

    SandboxSource* src = findSource(sourceId);
    if (!src) return ActionResult::InvalidTarget;
    if (rangeBetween(c->state.pos, src->state.pos) > 1) return ActionResult::NotInRange;
    if (src->state.energy == 0) return ActionResult::NotEnoughResources;
    if (c->state.energy.free() == 0) return ActionResult::Full;

    const std::uint32_t amount = std::min({SandboxRules::kHarvestPerWork * c->state.countParts(BodyPart::Work),
                                           src->state.energy, c->state.energy.free()});
    src->state.energy -= amount;
    c->state.energy.used += amount;
    if (src->ticksToRegeneration == 0) {
        src->ticksToRegeneration = SandboxRules::kSourceRegenTicks;
    }
    return ActionResult::Ok;
}

ActionResult SandboxWorld::build(const std::string& creep, const std::string& siteId) {
    SandboxCreep* c = findCreep(creep);
    const ActionResult check = checkActor(c, BodyPart::Work);
    if (check != ActionResult::Ok) return check;

    ConstructionSiteState* site = findSite(siteId);
    if (!site) return ActionResult::InvalidTarget;
    if (!site->my) return ActionResult::NotOwner;
    if (c->state.energy.used == 0) return ActionResult::NotEnoughResources;
    if (rangeBetween(c->state.pos, site->pos) > 3) return ActionResult::NotInRange;

    const std::uint32_t amount = std::min({SandboxRules::kBuildPerWork * c->state.countParts(BodyPart::Work),
                                           c->state.energy.used, site->progressTotal - site->progress});
    c->state.energy.used -= amount;
    site->progress += amount;

    if (site->progress >= site->progressTotal) {
        StructureState built = makeStructure(site->kind, site->pos, site->my);
        built.id = makeId(toString(site->kind));
        structures_.push_back(built);
        sites_.erase(std::remove_if(sites_.begin(), sites_.end(),
                                    [&](const ConstructionSiteState& s) { return s.id == siteId; }),
                     sites_.end());
    }
    return ActionResult::Ok;
}

ActionResult SandboxWorld::transfer(const std::string& creep, const std::string& targetId, ResourceKind /*resource*/) {
    SandboxCreep* c = findCreep(creep);
    const ActionResult check = checkActor(c, BodyPart::Carry);
    if (check != ActionResult::Ok) return check;

    StructureState* target = findStructure(targetId);
    if (!target || !target->energy) return ActionResult::InvalidTarget;
    if (c->state.energy.used == 0) return ActionResult::NotEnoughResources;
    if (rangeBetween(c->state.pos, target->pos) > 1) return ActionResult::NotInRange;
    if (target->energy->free() == 0) return ActionResult::Full;

    const std::uint32_t amount = std::min(c->state.energy.used, target->energy->free());
    c->state.energy.used -= amount;
    target->energy->used += amount;
    return ActionResult::Ok;
}

ActionResult SandboxWorld::repair(const std::string& creep, const std::string& structureId) {
    SandboxCreep* c = findCreep(creep);
    const ActionResult check = checkActor(c, BodyPart::Work);
    if (check != ActionResult::Ok) return check;

    StructureState* target = findStructure(structureId);
    if (!target || target->hits >= target->hitsMax) return ActionResult::InvalidTarget;
    if (c->state.energy.used == 0) return ActionResult::NotEnoughResources;
    if (rangeBetween(c->state.pos, target->pos) > 3) return ActionResult::NotInRange;

    const std::uint32_t missing = target->hitsMax - target->hits;
    const std::uint32_t wanted = (missing + SandboxRules::kRepairHitsPerWork - 1) / SandboxRules::kRepairHitsPerWork;
    const std::uint32_t spent = std::min({c->state.countParts(BodyPart::Work), c->state.energy.used, wanted});
    c->state.energy.used -= spent;
    target->hits += std::min(spent * SandboxRules::kRepairHitsPerWork, missing);
    return ActionResult::Ok;
}

ActionResult SandboxWorld::upgradeController(const std::string& creep, const std::string& controllerId) {
    SandboxCreep* c = findCreep(creep);
    const ActionResult check = checkActor(c, BodyPart::Work);
    if (check != ActionResult::Ok) return check;

    ControllerState* ctrl = findController(controllerId);
    if (!ctrl) return ActionResult::InvalidTarget;
    if (!ctrl->my) return ActionResult::NotOwner;
    if (c->state.energy.used == 0) return ActionResult::NotEnoughResources;
    if (rangeBetween(c->state.pos, ctrl->pos) > 3) return ActionResult::NotInRange;

    const std::uint32_t amount = std::min(SandboxRules::kUpgradePerWork * c->state.countParts(BodyPart::Work),
                                          c->state.energy.used);
    c->state.energy.used -= amount;
    ctrl->progress += amount;
    ctrl->ticksToDowngrade = SandboxRules::kControllerDowngrade[static_cast<std::size_t>(ctrl->level)];

    const std::uint32_t needed = SandboxRules::kControllerLevelProgress[static_cast<std::size_t>(ctrl->level)];
    if (needed > 0 && ctrl->progress >= needed) {
        ctrl->progress -= needed;
        ctrl->level++;
        ctrl->ticksToDowngrade = SandboxRules::kControllerDowngrade[static_cast<std::size_t>(ctrl->level)];
    }
    return ActionResult::Ok;
}

// ---------- Structure directives ----------
ActionResult SandboxWorld::towerAttack(const std::string& towerId, const std::string& hostileId) {
    StructureState* tower = findStructure(towerId);
    if (!tower || tower->kind != StructureKind::Tower) return ActionResult::InvalidTarget;
    if (!tower->my) return ActionResult::NotOwner;
    if (!tower->energy || tower->energy->used < SandboxRules::kTowerEnergyCost) return ActionResult::NotEnoughResources;

    HostileState* hostile = findHostile(hostileId);
    if (!hostile) return ActionResult::InvalidTarget;
    const int range = rangeBetween(tower->pos, hostile->pos);
    if (range == kUnreachableRange) return ActionResult::NotInRange;

    tower->energy->used -= SandboxRules::kTowerEnergyCost;
    const std::uint32_t damage = SandboxRules::towerDamage(range);
    if (hostile->hits <= damage) {
        hostiles_.erase(std::remove_if(hostiles_.begin(), hostiles_.end(),
                                       [&](const HostileState& h) { return h.id == hostileId; }),
                        hostiles_.end());
    } else {
        hostile->hits -= damage;
    }
    return ActionResult::Ok;
}

ActionResult SandboxWorld::spawnCreep(const std::string& spawnId, const Loadout& body, const std::string& name) {
    StructureState* spawn = findStructure(spawnId);
    if (!spawn || spawn->kind != StructureKind::Spawn) return ActionResult::InvalidTarget;
    if (!spawn->my) return ActionResult::NotOwner;
    if (body.empty() || body.size() > SandboxRules::kMaxBodyParts) return ActionResult::InvalidArgs;
    if (findCreep(name)) return ActionResult::NameExists;
    if (spawnIsBusy(spawnId)) return ActionResult::Busy;

    const std::uint32_t cost = loadoutCost(body);
    if (cost > roomEnergy(spawn->pos.room, false)) return ActionResult::NotEnoughResources;
    const Position at = spawn->pos;
    spendRoomEnergy(at.room, cost);

    SandboxCreep c;
    c.state.name = name;
    c.state.pos = at;
    c.state.pos.y = std::min(at.y + 1, kRoomSize - 1);
    c.state.spawning = true;
    c.state.body = body;
    c.state.energy.capacity = SandboxRules::kCarryCapacity * c.state.countParts(BodyPart::Carry);
    c.spawnId = spawnId;
    c.spawnTicksLeft = SandboxRules::kSpawnTicksPerPart * static_cast<std::uint32_t>(body.size());
    creeps_.push_back(c);
    return ActionResult::Ok;
}

// ---------- Scenario building ----------
void SandboxWorld::addRoom(const std::string& name) {
    if (findRoom(name)) {
        throw std::invalid_argument("room '" + name + "' already exists");
    }
    RoomData r;
    r.name = name;
    r.terrain.fill(Terrain::Plain);
    rooms_.push_back(r);
}

void SandboxWorld::setTerrain(const Position& pos, Terrain terrain) {
    requireRoom(pos);
    for (auto& r : rooms_) {
        if (r.name == pos.room) {
            r.terrain[static_cast<std::size_t>(pos.y * kRoomSize + pos.x)] = terrain;
        }
    }
}

std::string SandboxWorld::addController(const Position& pos, int level, std::uint32_t ticksToDowngrade, bool my) {
    requireRoom(pos);
    if (level < 0 || level > 8) {
        throw std::invalid_argument("controller level must be 0..8 (got " + std::to_string(level) + ")");
    }
    ControllerState c;
    c.id = makeId("controller");
    c.pos = pos;
    c.my = my;
    c.level = level;
    c.ticksToDowngrade = ticksToDowngrade;
    controllers_.push_back(c);
    return c.id;
}

std::string SandboxWorld::addSource(const Position& pos, std::uint32_t energy) {
    requireRoom(pos);
    SandboxSource s;
    s.state.id = makeId("source");
    s.state.pos = pos;
    s.state.energyCapacity = SandboxRules::kSourceCapacity;
    s.state.energy = std::min(energy, SandboxRules::kSourceCapacity);
    if (s.state.energy < s.state.energyCapacity) {
        s.ticksToRegeneration = SandboxRules::kSourceRegenTicks;
    }
    sources_.push_back(s);
    return s.state.id;
}

std::string SandboxWorld::addStructure(StructureKind kind, const Position& pos, bool my) {
    requireRoom(pos);
    if (kind == StructureKind::Controller) {
        throw std::invalid_argument("use addController for controllers");
    }
    StructureState s = makeStructure(kind, pos, my);
    s.id = makeId(toString(kind));
    structures_.push_back(s);
    return s.id;
}

std::string SandboxWorld::addSite(StructureKind kind, const Position& pos, std::uint32_t progressTotal) {
    requireRoom(pos);
    if (progressTotal == 0) {
        throw std::invalid_argument("construction site needs progressTotal > 0");
    }
    ConstructionSiteState site;
    site.id = makeId("site");
    site.pos = pos;
    site.kind = kind;
    site.progressTotal = progressTotal;
    sites_.push_back(site);
    return site.id;
}

std::string SandboxWorld::addHostile(const Position& pos, std::uint32_t hits, const std::string& owner) {
    requireRoom(pos);
    HostileState h;
    h.id = makeId("hostile");
    h.pos = pos;
    h.owner = owner;
    h.hits = hits;
    hostiles_.push_back(h);
    return h.id;
}

void SandboxWorld::addCreep(const std::string& name, const Position& pos, const Loadout& body, std::uint32_t energy) {
    requireRoom(pos);
    if (findCreep(name)) {
        throw std::invalid_argument("creep '" + name + "' already exists");
    }
    SandboxCreep c;
    c.state.name = name;
    c.state.pos = pos;
    c.state.body = body;
    c.state.energy.capacity = SandboxRules::kCarryCapacity * c.state.countParts(BodyPart::Carry);
    c.state.energy.used = std::min(energy, c.state.energy.capacity);
    creeps_.push_back(c);
}

// ---------- Direct manipulation ----------
bool SandboxWorld::removeObject(const std::string& id) {
    const auto before = controllers_.size() + sources_.size() + structures_.size() + sites_.size() + hostiles_.size();
    controllers_.erase(std::remove_if(controllers_.begin(), controllers_.end(),
                                      [&](const ControllerState& o) { return o.id == id; }), controllers_.end());
    sources_.erase(std::remove_if(sources_.begin(), sources_.end(),
                                  [&](const SandboxSource& o) { return o.state.id == id; }), sources_.end());
    structures_.erase(std::remove_if(structures_.begin(), structures_.end(),
                                     [&](const StructureState& o) { return o.id == id; }), structures_.end());
    sites_.erase(std::remove_if(sites_.begin(), sites_.end(),
                                [&](const ConstructionSiteState& o) { return o.id == id; }), sites_.end());
    hostiles_.erase(std::remove_if(hostiles_.begin(), hostiles_.end(),
                                   [&](const HostileState& o) { return o.id == id; }), hostiles_.end());
    const auto after = controllers_.size() + sources_.size() + structures_.size() + sites_.size() + hostiles_.size();
    return after < before;
}

bool SandboxWorld::removeCreep(const std::string& name) {
    const auto before = creeps_.size();
    creeps_.erase(std::remove_if(creeps_.begin(), creeps_.end(),
                                 [&](const SandboxCreep& c) { return c.state.name == name; }), creeps_.end());
    return creeps_.size() < before;
}

void SandboxWorld::setCreepEnergy(const std::string& name, std::uint32_t energy) {
    SandboxCreep* c = findCreep(name);
    if (!c) throw std::invalid_argument("no creep named '" + name + "'");
    c->state.energy.used = std::min(energy, c->state.energy.capacity);
}

void SandboxWorld::setCreepPosition(const std::string& name, const Position& pos) {
    requireRoom(pos);
    SandboxCreep* c = findCreep(name);
    if (!c) throw std::invalid_argument("no creep named '" + name + "'");
    c->state.pos = pos;
}

void SandboxWorld::setStructureHits(const std::string& id, std::uint32_t hits) {
    StructureState* s = findStructure(id);
    if (!s) throw std::invalid_argument("no structure with id '" + id + "'");
    s->hits = std::min(hits, s->hitsMax);
}

void SandboxWorld::setStructureEnergy(const std::string& id, std::uint32_t energy) {
    StructureState* s = findStructure(id);
    if (!s || !s->energy) throw std::invalid_argument("no structure with a store and id '" + id + "'");
    s->energy->used = std::min(energy, s->energy->capacity);
}

void SandboxWorld::setSourceEnergy(const std::string& id, std::uint32_t energy) {
    SandboxSource* s = findSource(id);
    if (!s) throw std::invalid_argument("no source with id '" + id + "'");
    s->state.energy = std::min(energy, s->state.energyCapacity);
    if (s->state.energy < s->state.energyCapacity && s->ticksToRegeneration == 0) {
        s->ticksToRegeneration = SandboxRules::kSourceRegenTicks;
    }
}

void SandboxWorld::setControllerDowngrade(const std::string& id, std::uint32_t ticksToDowngrade) {
    ControllerState* c = findController(id);
    if (!c) throw std::invalid_argument("no controller with id '" + id + "'");
    c->ticksToDowngrade = ticksToDowngrade;
}

// ---------- Tick ----------
void SandboxWorld::advance() {
    ++tick_;
    tickStart_ = std::chrono::steady_clock::now();

    for (auto& src : sources_) {
        if (src.ticksToRegeneration == 0) continue;
        if (--src.ticksToRegeneration == 0) {
            src.state.energy = src.state.energyCapacity;
        }
    }

    for (auto& ctrl : controllers_) {
        if (!ctrl.my || ctrl.level == 0) continue;
        if (ctrl.ticksToDowngrade > 0) {
            ctrl.ticksToDowngrade--;
        }
        if (ctrl.ticksToDowngrade == 0) {
            ctrl.level--;
            ctrl.progress = 0;
            ctrl.ticksToDowngrade = SandboxRules::kControllerDowngrade[static_cast<std::size_t>(ctrl.level)];
        }
    }

    if (tick_ % SandboxRules::kRoadDecayInterval == 0) {
        for (auto& s : structures_) {
            if (s.kind != StructureKind::Road) continue;
            const std::uint32_t decay = SandboxRules::kRoadDecayAmount *
                                        (SandboxRules::roadHitsMax(terrainAt(s.pos)) / SandboxRules::kRoadHits);
            s.hits = (s.hits > decay) ? s.hits - decay : 0;
        }
        structures_.erase(std::remove_if(structures_.begin(), structures_.end(),
                                         [](const StructureState& s) { return s.kind == StructureKind::Road && s.hits == 0; }),
                          structures_.end());
    }

    for (auto& c : creeps_) {
        if (c.spawnTicksLeft == 0) continue;
        if (--c.spawnTicksLeft == 0) {
            c.state.spawning = false;
            c.spawnId.clear();
        }
    }
}

// ---------- Internals ----------
std::string SandboxWorld::makeId(const char* prefix) {
    return std::string(prefix) + "-" + std::to_string(nextId_++);
}

void SandboxWorld::requireRoom(const Position& pos) const {
    if (!findRoom(pos.room)) {
        throw std::invalid_argument("unknown room '" + pos.room + "'");
    }
    if (pos.x < 0 || pos.x >= kRoomSize || pos.y < 0 || pos.y >= kRoomSize) {
        throw std::invalid_argument("position (" + std::to_string(pos.x) + "," + std::to_string(pos.y) +
                                    ") is outside room '" + pos.room + "'");
    }
}

const SandboxWorld::RoomData* SandboxWorld::findRoom(const std::string& name) const {
    for (const auto& r : rooms_) {
        if (r.name == name) return &r;
    }
    return nullptr;
}

SandboxWorld::SandboxCreep* SandboxWorld::findCreep(const std::string& name) {
    return findIn(creeps_, [&](const SandboxCreep& c) { return c.state.name == name; });
}

const SandboxWorld::SandboxCreep* SandboxWorld::findCreep(const std::string& name) const {
    for (const auto& c : creeps_) {
        if (c.state.name == name) return &c;
    }
    return nullptr;
}

ControllerState* SandboxWorld::findController(const std::string& id) {
    return findIn(controllers_, [&](const ControllerState& c) { return c.id == id; });
}

SandboxWorld::SandboxSource* SandboxWorld::findSource(const std::string& id) {
    return findIn(sources_, [&](const SandboxSource& s) { return s.state.id == id; });
}

StructureState* SandboxWorld::findStructure(const std::string& id) {
    return findIn(structures_, [&](const StructureState& s) { return s.id == id; });
}

ConstructionSiteState* SandboxWorld::findSite(const std::string& id) {
    return findIn(sites_, [&](const ConstructionSiteState& s) { return s.id == id; });
}

HostileState* SandboxWorld::findHostile(const std::string& id) {
    return findIn(hostiles_, [&](const HostileState& h) { return h.id == id; });
}

ActionResult SandboxWorld::checkActor(const SandboxCreep* creep, BodyPart required) const {
    if (!creep) return ActionResult::NotFound;
    if (creep->state.spawning) return ActionResult::Busy;
    if (creep->state.countParts(required) == 0) return ActionResult::NoBodypart;
    return ActionResult::Ok;
}

StructureState SandboxWorld::makeStructure(StructureKind kind, const Position& pos, bool my) const {
    StructureState s;
    s.kind = kind;
    s.pos = pos;
    s.my = my;
    switch (kind) {
        case StructureKind::Spawn:
            s.hitsMax = 5000;
            s.energy = Capacity{300, 300};
            break;
        case StructureKind::Extension:
            s.hitsMax = 1000;
            s.energy = Capacity{0, 50};
            break;
        case StructureKind::Tower:
            s.hitsMax = 3000;
            s.energy = Capacity{0, 1000};
            break;
        case StructureKind::Road:
            s.hitsMax = SandboxRules::roadHitsMax(terrainAt(pos));
            s.my = false;  // roads have no owner
            break;
        case StructureKind::Container:
            s.hitsMax = 250000;
            s.energy = Capacity{0, 2000};
            s.my = false;
            break;
        case StructureKind::Wall:
            s.hitsMax = 300000000;
            s.my = false;
            break;
        case StructureKind::Rampart:
            s.hitsMax = 300000;
            break;
        case StructureKind::Controller:
            break;
    }
    s.hits = (kind == StructureKind::Wall || kind == StructureKind::Rampart) ? 1 : s.hitsMax;
    return s;
}

bool SandboxWorld::spawnIsBusy(const std::string& spawnId) const {
    return std::any_of(creeps_.begin(), creeps_.end(), [&](const SandboxCreep& c) {
        return c.spawnTicksLeft > 0 && c.spawnId == spawnId;
    });
}

std::uint32_t SandboxWorld::roomEnergy(const std::string& room, bool capacity) const {
    std::uint32_t total = 0;
    for (const auto& s : structures_) {
        if (s.pos.room != room || !s.my || !s.energy) continue;
        if (s.kind != StructureKind::Spawn && s.kind != StructureKind::Extension) continue;
        total += capacity ? s.energy->capacity : s.energy->used;
    }
    return total;
}

void SandboxWorld::spendRoomEnergy(const std::string& room, std::uint32_t amount) {
    // Spawns first, then extensions, in insertion order
    for (auto kind : {StructureKind::Spawn, StructureKind::Extension}) {
        for (auto& s : structures_) {
            if (amount == 0) return;
            if (s.kind != kind || s.pos.room != room || !s.my || !s.energy) continue;
            const std::uint32_t taken = std::min(amount, s.energy->used);
            s.energy->used -= taken;
            amount -= taken;
        }
    }
}
