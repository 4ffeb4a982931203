#pragma once

#include "agent_process_repository.hpp"
#include "platform_services.hpp"
#include "goapagent/core/config.hpp"
#include "goapagent/core/result.hpp"
#include "goapagent/model/agent.hpp"
#include "goapagent/process/agent_process.hpp"

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace goapagent::platform {

using process::AgentProcess;
using process::ProcessOptions;

// Starting objects for a new process, keyed by binding name
using ProcessBindings = std::map<std::string, model::DomainObjectPtr>;

// Hosts deployed agents and the processes running them.
// As a scope it exposes everything every deployed agent can do.
class AgentPlatform : public model::AgentScope {
public:
    AgentPlatform(std::string name,
                  std::string description,
                  PlatformServices services,
                  std::shared_ptr<AgentProcessRepository> repository = nullptr,
                  std::shared_ptr<AgentProcessIdGenerator> id_generator = nullptr);

    // Platform with default services sized from `config`. Logs every event
    // at info level in addition to `listeners`.
    static std::unique_ptr<AgentPlatform> create(const Config& config,
                                                 std::vector<event::EventListenerPtr> listeners = {});

    // Fails with AgentAlreadyDeployed for a second agent with the same name
    Result<model::AgentPtr, Error> deploy(model::AgentPtr agent);

    // Builds an agent from the scope and deploys it
    Result<model::AgentPtr, Error> deploy(const model::AgentScope& scope,
                                          const std::string& provider,
                                          const std::string& version);

    std::vector<model::AgentPtr> agents() const;

    // Null if no agent has this name
    model::AgentPtr find_agent(const std::string& name) const;

    // Process in NOT_STARTED with `bindings` bound on its blackboard ("it"
    // entries are added anonymously)
    Result<process::AgentProcessPtr, Error> create_agent_process(
        model::AgentPtr agent,
        ProcessOptions options,
        const ProcessBindings& bindings = {});

    // Create and run synchronously on the calling thread
    Result<process::AgentProcessPtr, Error> run_agent_from(
        model::AgentPtr agent,
        ProcessOptions options,
        const ProcessBindings& bindings = {});

    // Child with a copy of the parent's blackboard, its options and an id
    // of the form "<parent> >> <id>"
    process::AgentProcessPtr create_child_process(model::AgentPtr agent,
                                                  const AgentProcess& parent);

    // Null if unknown
    process::AgentProcessPtr get_agent_process(const ProcessId& id) const;

    // Fails with ProcessNotFound for an unknown id
    Result<process::AgentProcessPtr, Error> kill_agent_process(const ProcessId& id);

    // Runs the process through the Asyncer, creating a default one on first
    // use; exceptions surface from get()
    std::future<void> start(process::AgentProcessPtr agent_process);

    Json status_report() const;

    PlatformServices& services() { return services_; }

    std::string name() const override { return name_; }
    std::string description() const override { return description_; }
    std::vector<model::ActionPtr> actions() const override;
    std::vector<model::GoalPtr> goals() const override;
    std::vector<model::ConditionPtr> conditions() const override;
    std::vector<model::SchemaType> schema_types() const override;
    blackboard::AggregationRegistry aggregations() const override;

private:
    std::string name_;
    std::string description_;
    PlatformServices services_;
    std::shared_ptr<AgentProcessRepository> repository_;
    std::shared_ptr<AgentProcessIdGenerator> id_generator_;

    mutable std::mutex mutex_;
    std::map<std::string, model::AgentPtr> agents_;

    std::shared_ptr<Asyncer> asyncer();

    void emit(event::PlatformEventType type, std::string message, Json metadata = Json::object());
};

}  // namespace goapagent::platform
