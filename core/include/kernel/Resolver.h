#ifndef RESOLVER_H
#define RESOLVER_H

#include <optional>

#include "kernel/Task.h"
#include "kernel/World.h"

// Stable ref -> this tick's view of the object. nullopt means the referent is
// gone (or never existed); callers evict the task holding the ref.
std::optional<ControllerState> resolve(const World& world, const ControllerRef& ref);
std::optional<SourceState> resolve(const World& world, const SourceRef& ref);
std::optional<ConstructionSiteState> resolve(const World& world, const SiteRef& ref);
std::optional<StructureState> resolve(const World& world, const StructureRef& ref);

// Only succeeds for a structure of the ref's kind that has an energy store
std::optional<StructureState> resolve(const World& world, const StoreTargetRef& ref);

#endif
