#include "kernel/Resolver.h"

std::optional<ControllerState> resolve(const World& world, const ControllerRef& ref) {
    return world.controller(ref.id);
}

std::optional<SourceState> resolve(const World& world, const SourceRef& ref) {
    return world.source(ref.id);
}

std::optional<ConstructionSiteState> resolve(const World& world, const SiteRef& ref) {
    return world.constructionSite(ref.id);
}

std::optional<StructureState> resolve(const World& world, const StructureRef& ref) {
    return world.structure(ref.id);
}

std::optional<StructureState> resolve(const World& world, const StoreTargetRef& ref) {
    auto found = world.structure(storeTargetId(ref));
    if (!found || found->kind != storeKind(ref) || !found->energy) {
        return std::nullopt;
    }
    return found;
}
