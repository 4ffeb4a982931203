#pragma once

#include "goapagent/process/agent_process.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace goapagent::platform {

using process::AgentProcessPtr;

// Where a platform keeps its processes
class AgentProcessRepository {
public:
    virtual ~AgentProcessRepository() = default;

    // Null when unknown
    virtual AgentProcessPtr find_by_id(const ProcessId& id) const = 0;

    virtual std::vector<AgentProcessPtr> find_by_parent_id(const ProcessId& parent_id) const = 0;

    virtual std::vector<AgentProcessPtr> find_all() const = 0;

    virtual void save(AgentProcessPtr process) = 0;

    virtual bool remove(const ProcessId& id) = 0;
};

class InMemoryAgentProcessRepository : public AgentProcessRepository {
public:
    AgentProcessPtr find_by_id(const ProcessId& id) const override;
    std::vector<AgentProcessPtr> find_by_parent_id(const ProcessId& parent_id) const override;
    std::vector<AgentProcessPtr> find_all() const override;
    void save(AgentProcessPtr process) override;
    bool remove(const ProcessId& id) override;

private:
    mutable std::mutex mutex_;
    std::map<ProcessId, AgentProcessPtr> processes_;
};

// Names new processes
class AgentProcessIdGenerator {
public:
    virtual ~AgentProcessIdGenerator() = default;

    virtual ProcessId create_id(const model::Agent& agent, const process::ProcessOptions& options) = 0;
};

// Random UUID per process
class RandomAgentProcessIdGenerator : public AgentProcessIdGenerator {
public:
    ProcessId create_id(const model::Agent& agent, const process::ProcessOptions& options) override;
};

}  // namespace goapagent::platform
