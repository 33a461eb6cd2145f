#ifndef TASK_REGISTRY_H
#define TASK_REGISTRY_H

#include <cstddef>
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

#include "kernel/Task.h"

/**
 * Agent name -> current task, at most one per agent.
 *
 * Lives as long as the worker process; a worker restart starts from an
 * empty registry. Only the tick currently running may touch it.
 */
class TaskRegistry {
public:
    // Occupied-or-vacant view of one agent's slot. Every call re-looks-up the
    // slot by name, so an entry stays valid after its own removal.
    class Entry {
    public:
        const std::string& agent() const { return agent_; }
        bool occupied() const;
        bool vacant() const { return !occupied(); }

        // Throws std::logic_error on a vacant entry
        const TaskHandle& task() const;

        // Eviction; no-op on a vacant entry
        void remove();

        // Throws std::logic_error on an occupied entry
        void insert(TaskHandle task);

    private:
        friend class TaskRegistry;
        Entry(TaskRegistry& owner, std::string agent);

        TaskRegistry* owner_;
        std::string agent_;
    };

    Entry entry(const std::string& agent);

    // Read-only lookup; nullptr when the agent has no task
    const TaskHandle* find(const std::string& agent) const;

    std::size_t size() const { return tasks_.size(); }
    bool empty() const { return tasks_.empty(); }

    // Snapshot of the current keys
    std::vector<std::string> agents() const;

    // Drop entries of agents that no longer exist; returns the number removed
    std::size_t prune(const std::unordered_set<std::string>& liveAgents);

    void clear() { tasks_.clear(); }

    using const_iterator = std::map<std::string, TaskHandle>::const_iterator;
    const_iterator begin() const { return tasks_.begin(); }
    const_iterator end() const { return tasks_.end(); }

private:
    std::map<std::string, TaskHandle> tasks_;
};

#endif
