#pragma once

#include "early_termination.hpp"
#include "process_context.hpp"
#include "process_options.hpp"
#include "goapagent/blackboard/blackboard.hpp"
#include "goapagent/core/errors.hpp"
#include "goapagent/event/events.hpp"
#include "goapagent/model/agent.hpp"
#include "goapagent/model/awaitable.hpp"
#include "goapagent/plan/planner.hpp"
#include "goapagent/platform/platform_services.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace goapagent::process {

enum class AgentProcessStatus {
    NotStarted,
    Running,
    Completed,
    Failed,
    Waiting,     // An awaitable needs a response
    Paused,      // An action was scheduled for later
    Stuck,       // No plan to any goal
    Terminated,  // Stopped by an early termination policy
    Killed
};

std::string_view to_string(AgentProcessStatus status);

// Completed, failed, terminated or killed
bool is_finished(AgentProcessStatus status);

struct ActionInvocation {
    std::string action_name;
    TimePoint timestamp;
    Duration running_time{0};

    Json to_json() const {
        return Json{
            {"action", action_name},
            {"timestamp", to_epoch_millis(timestamp)},
            {"running_time_ms", running_time.count()}
        };
    }
};

// Why a process failed or was terminated
struct FailureInfo {
    std::string reason;
    std::optional<Error> error;
    std::optional<EarlyTermination> termination;

    Json to_json() const;
};

// One run of an agent: plans, executes one action per tick and replans
// against its own blackboard until a goal is reached or it cannot go on.
class AgentProcess {
public:
    AgentProcess(ProcessId id,
                 std::optional<ProcessId> parent_id,
                 model::AgentPtr agent,
                 ProcessOptions options,
                 blackboard::BlackboardPtr blackboard,
                 platform::PlatformServices services);
    ~AgentProcess();

    AgentProcess(const AgentProcess&) = delete;
    AgentProcess& operator=(const AgentProcess&) = delete;

    const ProcessId& id() const { return id_; }
    const std::optional<ProcessId>& parent_id() const { return parent_id_; }
    const model::AgentPtr& agent() const { return agent_; }
    const ProcessOptions& options() const { return options_; }
    blackboard::Blackboard& blackboard() { return *blackboard_; }
    const blackboard::Blackboard& blackboard() const { return *blackboard_; }
    const blackboard::BlackboardPtr& blackboard_ptr() const { return blackboard_; }
    platform::PlatformServices& services() { return services_; }
    ProcessContext& context() { return context_; }

    AgentProcessStatus status() const { return status_.load(); }
    bool finished() const { return is_finished(status()); }

    std::vector<ActionInvocation> history() const;
    size_t history_size() const;
    std::optional<plan::GoapWorldState> last_world_state() const;
    std::optional<FailureInfo> failure_info() const;

    // Goal of the most recent plan; null before the first plan
    plan::GoapGoalPtr goal() const;

    TimePoint start_time() const { return start_time_; }
    Duration running_time() const;

    // LLM usage reported by actions
    void record_usage(int64_t tokens, double cost);
    int64_t total_tokens() const { return tokens_.load(); }
    double cost() const;

    // Run until the process leaves RUNNING. Throws UsageError if the agent
    // has no goals. Does nothing on a completed, terminated or killed process.
    AgentProcess& run();

    // Plan once and execute at most one action
    AgentProcess& tick();

    // Emits and returns the kill event; nullopt if the process already finished
    std::optional<event::ProcessEvent> kill();

    AgentProcess& bind(const std::string& name, model::DomainObjectPtr value);
    AgentProcess& add_object(model::DomainObjectPtr value);
    AgentProcess& operator+=(model::DomainObjectPtr value) { return add_object(std::move(value)); }

    // Deliver the response to an awaitable. run() again to continue.
    model::ResponseImpact respond(const model::Awaitable& awaitable, bool accepted);

    // Last object of type T once the process completed, otherwise null
    template<typename T>
    std::shared_ptr<const T> result_of_type() const {
        if (status() != AgentProcessStatus::Completed) {
            return nullptr;
        }
        return blackboard_->last<T>();
    }

    Json to_json() const;
    std::string info_string() const;

private:
    ProcessId id_;
    std::optional<ProcessId> parent_id_;
    model::AgentPtr agent_;
    ProcessOptions options_;
    blackboard::BlackboardPtr blackboard_;
    platform::PlatformServices services_;
    ProcessContext context_;
    std::unique_ptr<plan::WorldStateDeterminer> determiner_;
    std::unique_ptr<plan::Planner> planner_;
    plan::GoapPlanningSystem planning_system_;

    std::atomic<AgentProcessStatus> status_{AgentProcessStatus::NotStarted};
    TimePoint start_time_;
    std::atomic<int64_t> tokens_{0};

    mutable std::mutex mutex_;
    std::vector<ActionInvocation> history_;
    std::optional<plan::GoapWorldState> last_world_state_;
    std::optional<FailureInfo> failure_info_;
    plan::GoapGoalPtr goal_;
    double cost_ = 0.0;

    void emit(event::ProcessEventType type, std::string message, Json metadata = Json::object());

    // Refuses to leave KILLED or TERMINATED
    bool update_status(AgentProcessStatus to);

    // Marks the process FAILED, then throws
    [[noreturn]] void fail_with_usage_error(Error error);

    void handle_stuck();

    model::ActionStatus execute_action(const model::Action& action);

    const model::Action& find_action(const std::string& name);

    friend class ProcessContext;
};

using AgentProcessPtr = std::shared_ptr<AgentProcess>;

}  // namespace goapagent::process
