#ifndef TASK_H
#define TASK_H

#include <cstdint>
#include <string>
#include <variant>

#include "kernel/WorldTypes.h"

// ---------- Stable references ----------
// A Ref is the serializable id of a world object. It must be resolved again
// every tick; see kernel/Resolver.h.
template <typename TagT>
struct ObjectRef {
    using Tag = TagT;
    std::string id;
};

template <typename TagT>
bool operator==(const ObjectRef<TagT>& a, const ObjectRef<TagT>& b) {
    return a.id == b.id;
}

struct ControllerTag {};
struct SourceTag {};
struct SiteTag {};
struct StructureTag {};
struct SpawnTag { static constexpr StructureKind kind = StructureKind::Spawn; };
struct ExtensionTag { static constexpr StructureKind kind = StructureKind::Extension; };
struct TowerTag { static constexpr StructureKind kind = StructureKind::Tower; };

using ControllerRef = ObjectRef<ControllerTag>;
using SourceRef = ObjectRef<SourceTag>;
using SiteRef = ObjectRef<SiteTag>;
using StructureRef = ObjectRef<StructureTag>;
using SpawnRef = ObjectRef<SpawnTag>;
using ExtensionRef = ObjectRef<ExtensionTag>;
using TowerRef = ObjectRef<TowerTag>;

// Structures an agent can deliver energy into. Adding an alternative here
// makes every std::visit over it fail to compile until handled.
using StoreTargetRef = std::variant<SpawnRef, ExtensionRef, TowerRef>;

StructureKind storeKind(const StoreTargetRef& ref);
const std::string& storeTargetId(const StoreTargetRef& ref);

// ---------- Tasks ----------
struct UpgradeTask { ControllerRef controller; };
struct HarvestTask { SourceRef source; };
struct ConstructTask { SiteRef site; };
struct RepairTask { StructureRef structure; };
struct StoreTask { StoreTargetRef target; };

inline bool operator==(const UpgradeTask& a, const UpgradeTask& b) { return a.controller == b.controller; }
inline bool operator==(const HarvestTask& a, const HarvestTask& b) { return a.source == b.source; }
inline bool operator==(const ConstructTask& a, const ConstructTask& b) { return a.site == b.site; }
inline bool operator==(const RepairTask& a, const RepairTask& b) { return a.structure == b.structure; }
inline bool operator==(const StoreTask& a, const StoreTask& b) { return a.target == b.target; }

using TaskHandle = std::variant<UpgradeTask, HarvestTask, ConstructTask, RepairTask, StoreTask>;

enum class TaskKind : std::uint8_t {
    Upgrade,
    Harvest,
    Construct,
    Repair,
    Store,
    COUNT
};

TaskKind kindOf(const TaskHandle& task);
const char* toString(TaskKind kind);

// Id of the object the task points at
const std::string& targetId(const TaskHandle& task);

// Short human-readable form, e.g. "store(extension:ext-3)"
std::string describe(const TaskHandle& task);

#endif
