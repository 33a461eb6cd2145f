#include "io/Snapshot.h"
#include <cstdio>
#include <sstream>
#include <iomanip>

namespace {
// Ids and names come from the host; escape what JSON requires
std::string escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}
}

std::string registryToJson(const TaskRegistry& registry, std::uint64_t tick) {
    std::ostringstream os;

    os << "{";
    os << "\"tick\":" << tick << ",";
    os << "\"count\":" << registry.size() << ",";

    os << "\"tasks\":[";
    bool first = true;
    for (const auto& [agent, task] : registry) {
        if (!first) os << ",";
        first = false;
        os << "{";
        os << "\"agent\":\"" << escape(agent) << "\",";
        os << "\"task\":\"" << toString(kindOf(task)) << "\",";
        if (const auto* store = std::get_if<StoreTask>(&task)) {
            os << "\"store\":\"" << toString(storeKind(store->target)) << "\",";
        }
        os << "\"target\":\"" << escape(targetId(task)) << "\"";
        os << "}";
    }
    os << "]";
    os << "}";

    return os.str();
}

std::string reportCsvHeader() {
    std::ostringstream os;
    os << "tick,agents,spawning,idle,pruned,assigned,evicted,completed,actions_ok,moves,"
       << "spawn_attempts,spawned,tower_attacks";
    for (std::size_t f = 0; f < static_cast<std::size_t>(Failure::COUNT); ++f) {
        os << "," << toString(static_cast<Failure>(f));
    }
    os << ",cpu";
    return os.str();
}

void logReport(const TickReport& report, std::ostream& out) {
    out << report.tick << ","
        << report.agentsProcessed << ","
        << report.agentsSpawning << ","
        << report.idleAgents << ","
        << report.entriesPruned << ","
        << report.tasksAssigned << ","
        << report.tasksEvicted << ","
        << report.tasksCompleted << ","
        << report.actionsOk << ","
        << report.moves << ","
        << report.spawnAttempts << ","
        << report.spawned << ","
        << report.towerAttacks;
    for (auto count : report.failures) {
        out << "," << count;
    }
    out << "," << std::fixed << std::setprecision(4) << report.cpuUsed << "\n";
}
