#ifndef GAME_SCENARIOS_H
#define GAME_SCENARIOS_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "world/SandboxWorld.h"

constexpr const char* kStarterRoom = "W1N1";

// Named starting layouts for the sandbox:
//   starter  one owned room, RCL 2, two sources, extensions, tower, roads, a site
//   barren   owned room without any source and one empty creep
//   siege    starter plus a stocked tower and invaders at the edge
// Unknown names fall back to "starter" with a warning.
std::unique_ptr<SandboxWorld> buildScenario(const std::string& name, std::uint64_t seed);

std::vector<std::string> scenarioNames();

#endif
