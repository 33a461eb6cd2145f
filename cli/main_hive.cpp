#include "kernel/Kernel.h"
#include "io/Snapshot.h"
#include "utils/Logging.h"
#include "world/Scenarios.h"
#include <omp.h>
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <filesystem>
#include <cstdlib>
#include <memory>
#include <vector>

static void printHelp() {
    std::cerr << "Hive Commands:\n"
              << "  step N             # advance N ticks, print the task registry\n"
              << "  run T log          # run T ticks, log a report row every 'log' ticks\n"
              << "  tasks              # print the task registry as JSON\n"
              << "  report             # print the last tick report\n"
              << "  world              # print room and creep summary\n"
              << "  restart            # worker restart: registry cleared, RNG reseeded\n"
              << "  reset [scenario]   # rebuild the world (starter, barren, siege)\n"
              << "  sweep W T          # run W independent worlds for T ticks in parallel\n"
              << "  quit               # exit\n"
              << "\nOptions: --seed=N --log=LEVEL --scenario=NAME (or HIVE_SEED, HIVE_LOG_LEVEL, HIVE_SCENARIO)\n";
}

static void printReport(const TickReport& r) {
    std::cout << "Tick " << r.tick << "\n"
              << "  agents: " << r.agentsProcessed << " (spawning " << r.agentsSpawning
              << ", idle " << r.idleAgents << ")\n"
              << "  tasks: assigned " << r.tasksAssigned << ", evicted " << r.tasksEvicted
              << ", completed " << r.tasksCompleted << ", pruned " << r.entriesPruned << "\n"
              << "  actions ok: " << r.actionsOk << ", moves: " << r.moves << "\n"
              << "  spawn: " << r.spawned << "/" << r.spawnAttempts << ", tower attacks: " << r.towerAttacks << "\n"
              << "  failures:";
    for (std::size_t f = 0; f < static_cast<std::size_t>(Failure::COUNT); ++f) {
        std::cout << " " << toString(static_cast<Failure>(f)) << "=" << r.failures[f];
    }
    std::cout << "\n  cpu: " << std::fixed << std::setprecision(3) << r.cpuUsed << "\n";
    std::cout.flush();
}

static void printWorld(const SandboxWorld& world, const WorkerState& state) {
    std::cout << "\n=== World (tick " << world.time() << ") ===\n";
    for (const auto& name : world.roomNames()) {
        auto room = world.room(name);
        if (!room) continue;
        std::cout << "Room " << name << ": energy " << room->energyAvailable << "/"
                  << room->energyCapacityAvailable << ", sources active " << room->activeSources.size()
                  << ", sites " << room->sites.size() << ", hostiles " << room->hostiles.size() << "\n";
        if (room->controller) {
            std::cout << "  Controller level " << room->controller->level
                      << " progress " << room->controller->progress
                      << " downgrade in " << room->controller->ticksToDowngrade << "\n";
        }
    }
    for (const auto& creep : world.creeps()) {
        const TaskHandle* task = state.registry.find(creep.name);
        std::cout << "  " << std::setw(10) << creep.name
                  << " @(" << creep.pos.x << "," << creep.pos.y << ")"
                  << " energy " << creep.energy.used << "/" << creep.energy.capacity
                  << (creep.spawning ? " [spawning]" : "")
                  << " task " << (task ? describe(*task) : std::string("-")) << "\n";
    }
    std::cout << "\n";
    std::cout.flush();
}

struct SweepResult {
    std::uint64_t seed = 0;
    std::size_t creeps = 0;
    int controllerLevel = 0;
    std::uint32_t controllerProgress = 0;
    std::uint32_t spawned = 0;
    std::uint32_t evictions = 0;
};

// Each world gets its own kernel and worker state; nothing is shared
static std::vector<SweepResult> runSweep(const KernelConfig& cfg, const std::string& scenario,
                                         int worlds, int ticks) {
    std::vector<SweepResult> results(static_cast<std::size_t>(worlds));

    #pragma omp parallel for schedule(dynamic)
    for (int w = 0; w < worlds; ++w) {
        const std::uint64_t seed = cfg.seed + static_cast<std::uint64_t>(w);
        KernelConfig local = cfg;
        local.seed = seed;
        Kernel kernel(local);
        WorkerState state(seed);
        auto world = buildScenario(scenario, seed);

        SweepResult& out = results[static_cast<std::size_t>(w)];
        out.seed = seed;
        for (int t = 0; t < ticks; ++t) {
            const TickReport r = kernel.step(*world, state);
            out.spawned += r.spawned;
            out.evictions += r.tasksEvicted;
            world->advance();
        }
        out.creeps = world->creeps().size();
        if (auto room = world->room(kStarterRoom); room && room->controller) {
            out.controllerLevel = room->controller->level;
            out.controllerProgress = room->controller->progress;
        }
    }
    return results;
}

int main(int argc, char** argv) {
    KernelConfig cfg;
    std::string scenario = "starter";
    std::string logLevel = "info";

    if (const char* envSeed = std::getenv("HIVE_SEED")) {
        cfg.seed = std::strtoull(envSeed, nullptr, 10);
    }
    if (const char* envLog = std::getenv("HIVE_LOG_LEVEL")) {
        logLevel = envLog;
    }
    if (const char* envScenario = std::getenv("HIVE_SCENARIO")) {
        scenario = envScenario;
    }

    const char* scriptArg = nullptr;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--seed=", 0) == 0) {
            cfg.seed = std::strtoull(arg.substr(7).c_str(), nullptr, 10);
        } else if (arg.rfind("--log=", 0) == 0) {
            logLevel = arg.substr(6);
        } else if (arg.rfind("--scenario=", 0) == 0) {
            scenario = arg.substr(11);
        } else if (arg == "--help" || arg == "-h") {
            printHelp();
            return 0;
        } else if (arg.size() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        } else {
            scriptArg = argv[i];
            break;
        }
    }

    setupLogging(parseLogLevel(logLevel));

    Kernel kernel(cfg);
    WorkerState state(cfg.seed);
    auto world = buildScenario(scenario, cfg.seed);

    std::istream* input = &std::cin;
    std::ifstream scriptFile;

    if (scriptArg) {
        scriptFile.open(scriptArg);
        if (!scriptFile.is_open()) {
            spdlog::error("Could not open script file '{}'", scriptArg);
            return 1;
        }
        input = &scriptFile;
        spdlog::info("Running commands from script file: {}", scriptArg);
    } else {
        std::ios::sync_with_stdio(false);
        std::cin.tie(nullptr);
        printHelp();
    }

    auto tick = [&]() {
        const TickReport r = kernel.step(*world, state);
        world->advance();
        return r;
    };

    std::string line;
    while (std::getline(*input, line)) {
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) {
            continue;
        }
        spdlog::debug("Command: '{}'", line);

        if (cmd == "step") {
            int n = 1;
            iss >> n;
            if (n < 1) n = 1;
            for (int i = 0; i < n; ++i) {
                tick();
            }
            std::cout << registryToJson(state.registry, world->time()) << "\n";
            std::cout.flush();

        } else if (cmd == "run") {
            int ticks = 100;
            int logFreq = 10;
            iss >> ticks >> logFreq;
            if (logFreq < 1) logFreq = 1;

            std::filesystem::create_directories("data");
            const bool isNewFile = !std::filesystem::exists("data/report.csv");
            std::ofstream reportFile("data/report.csv", std::ios::app);
            if (isNewFile) {
                reportFile << reportCsvHeader() << "\n";
            }

            for (int t = 0; t < ticks; ++t) {
                const TickReport r = tick();
                if (t % logFreq == 0 || t == ticks - 1) {
                    logReport(r, reportFile);
                    std::cout << "Tick " << r.tick << ": "
                              << "Creeps=" << world->creeps().size() << ", "
                              << "Tasks=" << state.registry.size() << ", "
                              << "Assigned=" << r.tasksAssigned << ", "
                              << "Evicted=" << r.tasksEvicted << ", "
                              << "Idle=" << r.idleAgents << "\n";
                    std::cout.flush();
                }
            }
            std::cout << "Completed " << ticks << " ticks. Reports written to data/report.csv\n";
            std::cout.flush();

        } else if (cmd == "tasks") {
            std::cout << registryToJson(state.registry, world->time()) << "\n";
            std::cout.flush();

        } else if (cmd == "report") {
            printReport(kernel.lastReport());

        } else if (cmd == "world") {
            printWorld(*world, state);

        } else if (cmd == "restart") {
            state.restart(cfg.seed);
            std::cout << "Worker restarted at tick " << world->time() << " (registry cleared)\n";
            std::cout.flush();

        } else if (cmd == "reset") {
            std::string name;
            if (iss >> name) {
                scenario = name;
            }
            world = buildScenario(scenario, cfg.seed);
            state.restart(cfg.seed);
            std::cout << "Reset: scenario " << scenario << " at tick " << world->time() << "\n";
            std::cout.flush();

        } else if (cmd == "sweep") {
            int worlds = 4;
            int ticks = 500;
            iss >> worlds >> ticks;
            worlds = std::clamp(worlds, 1, 256);
            if (ticks < 1) ticks = 1;

            spdlog::info("Sweeping {} worlds x {} ticks on up to {} threads", worlds, ticks, omp_get_max_threads());
            const auto previous = spdlog::default_logger()->level();
            spdlog::set_level(spdlog::level::warn);
            const auto results = runSweep(cfg, scenario, worlds, ticks);
            spdlog::set_level(previous);

            std::cout << "seed,creeps,level,progress,spawned,evictions\n";
            for (const auto& r : results) {
                std::cout << r.seed << "," << r.creeps << "," << r.controllerLevel << ","
                          << r.controllerProgress << "," << r.spawned << "," << r.evictions << "\n";
            }
            std::cout.flush();

        } else if (cmd == "help") {
            printHelp();

        } else if (cmd == "quit" || cmd == "exit") {
            break;

        } else {
            std::cerr << "Unknown command: " << cmd << "\n";
            printHelp();
        }
    }

    return 0;
}
