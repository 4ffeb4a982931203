#include "goapagent/platform/agent_platform.hpp"
#include "goapagent/core/logging.hpp"
#include "goapagent/platform/thread_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace goapagent::platform {

using event::ProcessEvent;
using event::ProcessEventType;

namespace {

constexpr size_t kDefaultAsyncerThreads = 4;

}  // namespace

AgentPlatform::AgentPlatform(std::string name,
                             std::string description,
                             PlatformServices services,
                             std::shared_ptr<AgentProcessRepository> repository,
                             std::shared_ptr<AgentProcessIdGenerator> id_generator)
    : name_(std::move(name))
    , description_(std::move(description))
    , services_(services.with_defaults())
    , repository_(repository ? std::move(repository) : std::make_shared<InMemoryAgentProcessRepository>())
    , id_generator_(id_generator ? std::move(id_generator) : std::make_shared<RandomAgentProcessIdGenerator>())
{
}

std::unique_ptr<AgentPlatform> AgentPlatform::create(const Config& config,
                                                     std::vector<event::EventListenerPtr> listeners) {
    auto multicast = std::make_shared<event::MulticastEventListener>();
    multicast->add(std::make_shared<event::LoggingEventListener>(parse_log_level(config.observability.log_level)));
    for (auto& listener : listeners) {
        multicast->add(std::move(listener));
    }

    PlatformServices services;
    services.event_listener = multicast;
    services.asyncer = std::make_shared<ThreadPoolAsyncer>(
        static_cast<size_t>(std::max(1, config.concurrency.thread_pool_size)));
    services.operation_scheduler = std::make_shared<process::ProntoOperationScheduler>();
    services.planner_factory = astar_planner_factory(config.planner.max_iterations);

    auto platform = std::make_unique<AgentPlatform>("goapagent", "GOAP agent platform", std::move(services));
    platform->emit(event::PlatformEventType::PlatformReady, "Platform ready",
                   Json{{"thread_pool_size", config.concurrency.thread_pool_size},
                        {"max_iterations", config.planner.max_iterations}});
    return platform;
}

Result<model::AgentPtr, Error> AgentPlatform::deploy(model::AgentPtr agent) {
    if (!agent) {
        return Result<model::AgentPtr, Error>::err(ErrorCode::InvalidArgument, "Cannot deploy a null agent");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (agents_.count(agent->name()) > 0) {
            return Result<model::AgentPtr, Error>::err(ErrorCode::AgentAlreadyDeployed,
                                                       "Agent already deployed", agent->name());
        }
        agents_[agent->name()] = agent;
    }

    spdlog::info("Deployed agent {}: {} action(s), {} goal(s)", agent->name(),
                 agent->action_list().size(), agent->goals().size());
    emit(event::PlatformEventType::AgentDeployed, "Deployed agent " + agent->name(),
         Json{{"agent", agent->name()}, {"version", agent->version()}});
    return Result<model::AgentPtr, Error>::ok(agent);
}

Result<model::AgentPtr, Error> AgentPlatform::deploy(const model::AgentScope& scope,
                                                     const std::string& provider,
                                                     const std::string& version) {
    return deploy(scope.create_agent(scope.name(), provider, version, scope.description()));
}

std::vector<model::AgentPtr> AgentPlatform::agents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::AgentPtr> result;
    result.reserve(agents_.size());
    for (const auto& [name, agent] : agents_) {
        result.push_back(agent);
    }
    return result;
}

model::AgentPtr AgentPlatform::find_agent(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(name);
    return it == agents_.end() ? nullptr : it->second;
}

Result<process::AgentProcessPtr, Error> AgentPlatform::create_agent_process(
    model::AgentPtr agent,
    ProcessOptions options,
    const ProcessBindings& bindings) {

    if (!agent) {
        return Result<process::AgentProcessPtr, Error>::err(ErrorCode::InvalidArgument,
                                                            "Cannot run a null agent");
    }

    auto id = id_generator_->create_id(*agent, options);
    auto agent_process = std::make_shared<AgentProcess>(id, std::nullopt, agent, std::move(options),
                                                  nullptr, services_);
    services_.event_listener->on_process_event(
        ProcessEvent{ProcessEventType::ProcessCreated, id, agent->name(), "Process created",
                     Json{{"options", agent_process->options().to_json()}}});

    for (const auto& [name, value] : bindings) {
        if (name == kDefaultBinding) {
            agent_process->add_object(value);
        } else {
            agent_process->bind(name, value);
        }
    }

    repository_->save(agent_process);
    spdlog::debug("Created process {} for agent {}", id, agent->name());
    return Result<process::AgentProcessPtr, Error>::ok(agent_process);
}

Result<process::AgentProcessPtr, Error> AgentPlatform::run_agent_from(
    model::AgentPtr agent,
    ProcessOptions options,
    const ProcessBindings& bindings) {

    auto created = create_agent_process(std::move(agent), std::move(options), bindings);
    if (created.is_err()) {
        return created;
    }
    created.value()->run();
    return created;
}

process::AgentProcessPtr AgentPlatform::create_child_process(model::AgentPtr agent,
                                                             const AgentProcess& parent) {
    auto id = parent.id() + " >> " + id_generator_->create_id(*agent, parent.options());
    auto child = std::make_shared<AgentProcess>(id, parent.id(), agent, parent.options(),
                                                parent.blackboard().spawn(), services_);
    services_.event_listener->on_process_event(
        ProcessEvent{ProcessEventType::ProcessCreated, id, agent->name(), "Child process created",
                     Json{{"parent_id", parent.id()}}});
    repository_->save(child);
    return child;
}

process::AgentProcessPtr AgentPlatform::get_agent_process(const ProcessId& id) const {
    return repository_->find_by_id(id);
}

Result<process::AgentProcessPtr, Error> AgentPlatform::kill_agent_process(const ProcessId& id) {
    auto agent_process = repository_->find_by_id(id);
    if (!agent_process) {
        return Result<process::AgentProcessPtr, Error>::err(ErrorCode::ProcessNotFound,
                                                            "No such process", id);
    }
    agent_process->kill();
    return Result<process::AgentProcessPtr, Error>::ok(agent_process);
}

std::future<void> AgentPlatform::start(process::AgentProcessPtr agent_process) {
    return asyncer()->async([agent_process] {
        agent_process->run();
    });
}

std::shared_ptr<Asyncer> AgentPlatform::asyncer() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!services_.asyncer) {
        services_.asyncer = std::make_shared<ThreadPoolAsyncer>(kDefaultAsyncerThreads);
    }
    return services_.asyncer;
}

Json AgentPlatform::status_report() const {
    Json agents = Json::array();
    for (const auto& agent : this->agents()) {
        agents.push_back(Json{
            {"name", agent->name()},
            {"version", agent->version()},
            {"actions", agent->action_list().size()},
            {"goals", agent->goals().size()}
        });
    }

    Json processes = Json::array();
    std::map<std::string, int> by_status;
    for (const auto& agent_process : repository_->find_all()) {
        auto status = std::string(process::to_string(agent_process->status()));
        ++by_status[status];
        processes.push_back(Json{
            {"id", agent_process->id()},
            {"agent", agent_process->agent()->name()},
            {"status", status},
            {"actions", agent_process->history_size()},
            {"running_time_ms", agent_process->running_time().count()}
        });
    }

    return Json{
        {"name", name_},
        {"description", description_},
        {"agents", agents},
        {"processes", processes},
        {"process_counts", by_status}
    };
}

std::vector<model::ActionPtr> AgentPlatform::actions() const {
    std::vector<model::ActionPtr> result;
    for (const auto& agent : agents()) {
        const auto& actions = agent->action_list();
        result.insert(result.end(), actions.begin(), actions.end());
    }
    return result;
}

std::vector<model::GoalPtr> AgentPlatform::goals() const {
    std::vector<model::GoalPtr> result;
    for (const auto& agent : agents()) {
        auto goals = agent->goals();
        result.insert(result.end(), goals.begin(), goals.end());
    }
    return result;
}

std::vector<model::ConditionPtr> AgentPlatform::conditions() const {
    std::vector<model::ConditionPtr> result;
    for (const auto& agent : agents()) {
        const auto& conditions = agent->condition_list();
        result.insert(result.end(), conditions.begin(), conditions.end());
    }
    return result;
}

std::vector<model::SchemaType> AgentPlatform::schema_types() const {
    std::vector<model::SchemaType> references;
    for (const auto& agent : agents()) {
        auto types = agent->schema_types();
        references.insert(references.end(), types.begin(), types.end());
    }
    return model::merge_schema_types(references);
}

blackboard::AggregationRegistry AgentPlatform::aggregations() const {
    blackboard::AggregationRegistry registry;
    for (const auto& agent : agents()) {
        registry.merge(agent->aggregation_registry());
    }
    return registry;
}

void AgentPlatform::emit(event::PlatformEventType type, std::string message, Json metadata) {
    services_.event_listener->on_platform_event(
        event::PlatformEvent{type, name_, std::move(message), std::move(metadata)});
}

}  // namespace goapagent::platform
