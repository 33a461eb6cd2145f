#include "kernel/Task.h"

#include <type_traits>

namespace {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
}

StructureKind storeKind(const StoreTargetRef& ref) {
    return std::visit([](const auto& r) {
        return std::decay_t<decltype(r)>::Tag::kind;
    }, ref);
}

const std::string& storeTargetId(const StoreTargetRef& ref) {
    return std::visit([](const auto& r) -> const std::string& { return r.id; }, ref);
}

TaskKind kindOf(const TaskHandle& task) {
    return std::visit(overloaded{
        [](const UpgradeTask&) { return TaskKind::Upgrade; },
        [](const HarvestTask&) { return TaskKind::Harvest; },
        [](const ConstructTask&) { return TaskKind::Construct; },
        [](const RepairTask&) { return TaskKind::Repair; },
        [](const StoreTask&) { return TaskKind::Store; },
    }, task);
}

const char* toString(TaskKind kind) {
    switch (kind) {
        case TaskKind::Upgrade: return "upgrade";
        case TaskKind::Harvest: return "harvest";
        case TaskKind::Construct: return "construct";
        case TaskKind::Repair: return "repair";
        case TaskKind::Store: return "store";
        default: break;
    }
    return "unknown";
}

const std::string& targetId(const TaskHandle& task) {
    return std::visit(overloaded{
        [](const UpgradeTask& t) -> const std::string& { return t.controller.id; },
        [](const HarvestTask& t) -> const std::string& { return t.source.id; },
        [](const ConstructTask& t) -> const std::string& { return t.site.id; },
        [](const RepairTask& t) -> const std::string& { return t.structure.id; },
        [](const StoreTask& t) -> const std::string& { return storeTargetId(t.target); },
    }, task);
}

std::string describe(const TaskHandle& task) {
    std::string out = toString(kindOf(task));
    out += "(";
    if (const auto* store = std::get_if<StoreTask>(&task)) {
        out += toString(storeKind(store->target));
        out += ":";
    }
    out += targetId(task);
    out += ")";
    return out;
}
