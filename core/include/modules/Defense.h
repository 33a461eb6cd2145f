#ifndef DEFENSE_MODULE_H
#define DEFENSE_MODULE_H

#include <optional>
#include <vector>

#include "kernel/TickReport.h"
#include "kernel/World.h"

struct DefensePolicy {
    int towerRange = 50;  // a tower reaches the whole room
};

// Stateless: every tick each owned tower fires at the closest hostile.
class DefenseController {
public:
    explicit DefenseController(const DefensePolicy& policy = DefensePolicy());

    void run(World& world, TickReport& report) const;

    // Closest hostile within towerRange; ties keep the earlier hostile
    std::optional<HostileState> nearestHostile(const Position& from,
                                               const std::vector<HostileState>& hostiles) const;

private:
    DefensePolicy policy_;
};

#endif
