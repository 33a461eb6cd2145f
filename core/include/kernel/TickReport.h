#ifndef TICK_REPORT_H
#define TICK_REPORT_H

#include <array>
#include <cstddef>
#include <cstdint>

#include "kernel/WorldTypes.h"

// ---------- Failure taxonomy ----------
// Every failure is handled where it is detected; none crosses an agent.
enum class Failure : std::uint8_t {
    ReferentGone = 0,      // ref no longer resolves; evict
    OutOfRange = 1,        // too far for the action; move, keep the task
    ActionRejected = 2,    // any other action failure; warn and evict
    CreationRejected = 3,  // spawn directive failed; retried next tick
    EmptyCandidateSet = 4, // nothing to select; agent idles
    COUNT
};

const char* toString(Failure failure);

// Only ERR_NOT_IN_RANGE is OutOfRange; every other non-OK code is a rejection
Failure classifyAction(ActionResult result);

// ---------- Per-tick summary ----------
struct TickReport {
    std::uint64_t tick = 0;

    std::uint32_t agentsProcessed = 0;
    std::uint32_t agentsSpawning = 0;
    std::uint32_t idleAgents = 0;
    std::uint32_t entriesPruned = 0;

    std::uint32_t tasksAssigned = 0;
    std::uint32_t tasksEvicted = 0;
    std::uint32_t tasksCompleted = 0;
    std::uint32_t actionsOk = 0;
    std::uint32_t moves = 0;

    std::uint32_t spawnAttempts = 0;
    std::uint32_t spawned = 0;
    std::uint32_t towerAttacks = 0;

    std::array<std::uint32_t, static_cast<std::size_t>(Failure::COUNT)> failures{};

    double cpuUsed = 0.0;

    void count(Failure failure) { failures[static_cast<std::size_t>(failure)]++; }
    std::uint32_t failuresOf(Failure failure) const { return failures[static_cast<std::size_t>(failure)]; }
};

#endif
