#ifndef TICK_TIMER_H
#define TICK_TIMER_H

#include <string>

class World;

// Scope timer over the host's CPU counter. Logs the CPU spent inside the
// scope when destroyed; the engine reports against the budget but never
// enforces it.
class TickTimer {
public:
    TickTimer(std::string name, const World& world);
    ~TickTimer();

    TickTimer(const TickTimer&) = delete;
    TickTimer& operator=(const TickTimer&) = delete;

    double startedAt() const { return loaded_; }
    double elapsed() const;

private:
    std::string name_;
    const World& world_;
    double loaded_;
};

#endif
