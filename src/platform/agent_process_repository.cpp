#include "goapagent/platform/agent_process_repository.hpp"
#include "goapagent/core/uuid.hpp"

namespace goapagent::platform {

AgentProcessPtr InMemoryAgentProcessRepository::find_by_id(const ProcessId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(id);
    return it == processes_.end() ? nullptr : it->second;
}

std::vector<AgentProcessPtr> InMemoryAgentProcessRepository::find_by_parent_id(const ProcessId& parent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentProcessPtr> children;
    for (const auto& [id, process] : processes_) {
        if (process->parent_id() == parent_id) {
            children.push_back(process);
        }
    }
    return children;
}

std::vector<AgentProcessPtr> InMemoryAgentProcessRepository::find_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentProcessPtr> result;
    result.reserve(processes_.size());
    for (const auto& [id, process] : processes_) {
        result.push_back(process);
    }
    return result;
}

void InMemoryAgentProcessRepository::save(AgentProcessPtr process) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = process->id();
    processes_[id] = std::move(process);
}

bool InMemoryAgentProcessRepository::remove(const ProcessId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.erase(id) > 0;
}

ProcessId RandomAgentProcessIdGenerator::create_id(const model::Agent&, const process::ProcessOptions&) {
    return UUID::generate().to_string();
}

}  // namespace goapagent::platform
