#ifndef POPULATION_MODULE_H
#define POPULATION_MODULE_H

#include <cstdint>
#include <string>
#include <vector>

#include "kernel/TickReport.h"
#include "kernel/World.h"

struct PopulationRow {
    std::uint32_t ceiling = 0;  // row applies while population < ceiling
    std::uint32_t cost = 0;     // must equal loadoutCost(loadout)
    Loadout loadout;
};

// Rows in ascending ceiling order
struct PopulationTable {
    std::vector<PopulationRow> rows{
        {4, 200, {BodyPart::Work, BodyPart::Carry, BodyPart::Move}},
        {8, 300, {BodyPart::Work, BodyPart::Carry, BodyPart::Carry, BodyPart::Move, BodyPart::Move}},
        {12, 550, {BodyPart::Work, BodyPart::Work, BodyPart::Work, BodyPart::Carry, BodyPart::Carry,
                   BodyPart::Move, BodyPart::Move, BodyPart::Move}},
    };
};

class PopulationController {
public:
    // Throws std::invalid_argument on an empty or inconsistent table
    explicit PopulationController(const PopulationTable& table = PopulationTable());

    // One creation attempt per owned spawn while below the top ceiling
    void run(World& world, TickReport& report) const;

    // First row (ascending) with ceiling > population that energy covers;
    // nullptr when none does
    const PopulationRow* selectRow(std::uint32_t population, std::uint32_t energyAvailable) const;

    std::uint32_t maxPopulation() const { return table_.rows.back().ceiling; }

    static std::string creepName(std::uint64_t tick, std::uint32_t sequence);

    const PopulationTable& table() const { return table_; }

private:
    PopulationTable table_;
};

#endif
