#include "kernel/TaskRegistry.h"

#include <stdexcept>
#include <utility>

TaskRegistry::Entry::Entry(TaskRegistry& owner, std::string agent)
    : owner_(&owner), agent_(std::move(agent)) {}

bool TaskRegistry::Entry::occupied() const {
    return owner_->tasks_.count(agent_) > 0;
}

const TaskHandle& TaskRegistry::Entry::task() const {
    auto it = owner_->tasks_.find(agent_);
    if (it == owner_->tasks_.end()) {
        throw std::logic_error("task() on vacant registry entry for '" + agent_ + "'");
    }
    return it->second;
}

void TaskRegistry::Entry::remove() {
    owner_->tasks_.erase(agent_);
}

void TaskRegistry::Entry::insert(TaskHandle task) {
    auto inserted = owner_->tasks_.emplace(agent_, std::move(task));
    if (!inserted.second) {
        throw std::logic_error("insert() on occupied registry entry for '" + agent_ + "'");
    }
}

TaskRegistry::Entry TaskRegistry::entry(const std::string& agent) {
    return Entry(*this, agent);
}

const TaskHandle* TaskRegistry::find(const std::string& agent) const {
    auto it = tasks_.find(agent);
    return (it != tasks_.end()) ? &it->second : nullptr;
}

std::vector<std::string> TaskRegistry::agents() const {
    std::vector<std::string> names;
    names.reserve(tasks_.size());
    for (const auto& [name, task] : tasks_) {
        names.push_back(name);
    }
    return names;
}

std::size_t TaskRegistry::prune(const std::unordered_set<std::string>& liveAgents) {
    std::size_t removed = 0;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (liveAgents.count(it->first) == 0) {
            it = tasks_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}
