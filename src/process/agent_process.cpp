#include "goapagent/process/agent_process.hpp"
#include "goapagent/process/world_state_determiner.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <thread>

namespace goapagent::process {

using event::ProcessEventType;
using model::ActionStatusCode;

namespace {

// Explicit blackboard, then the options' one, then a fresh one
blackboard::BlackboardPtr choose_blackboard(blackboard::BlackboardPtr explicit_blackboard,
                                            const ProcessOptions& options) {
    if (explicit_blackboard) {
        return explicit_blackboard;
    }
    if (options.blackboard) {
        return options.blackboard;
    }
    return std::make_shared<blackboard::InMemoryBlackboard>();
}

}  // namespace

std::string_view to_string(AgentProcessStatus status) {
    switch (status) {
        case AgentProcessStatus::NotStarted: return "NOT_STARTED";
        case AgentProcessStatus::Running: return "RUNNING";
        case AgentProcessStatus::Completed: return "COMPLETED";
        case AgentProcessStatus::Failed: return "FAILED";
        case AgentProcessStatus::Waiting: return "WAITING";
        case AgentProcessStatus::Paused: return "PAUSED";
        case AgentProcessStatus::Stuck: return "STUCK";
        case AgentProcessStatus::Terminated: return "TERMINATED";
        case AgentProcessStatus::Killed: return "KILLED";
    }
    return "UNKNOWN";
}

bool is_finished(AgentProcessStatus status) {
    switch (status) {
        case AgentProcessStatus::Completed:
        case AgentProcessStatus::Failed:
        case AgentProcessStatus::Terminated:
        case AgentProcessStatus::Killed:
            return true;
        default:
            return false;
    }
}

Json FailureInfo::to_json() const {
    Json json{{"reason", reason}};
    if (error) {
        json["error"] = {
            {"code", static_cast<int>(error->code)},
            {"message", error->full_message()}
        };
    }
    if (termination) {
        json["termination"] = termination->to_json();
    }
    return json;
}

AgentProcess::AgentProcess(ProcessId id,
                           std::optional<ProcessId> parent_id,
                           model::AgentPtr agent,
                           ProcessOptions options,
                           blackboard::BlackboardPtr blackboard,
                           platform::PlatformServices services)
    : id_(std::move(id))
    , parent_id_(std::move(parent_id))
    , agent_(std::move(agent))
    , options_(std::move(options))
    , blackboard_(choose_blackboard(std::move(blackboard), options_))
    , services_(services.with_defaults())
    , context_(*this, services_)
    , determiner_(std::make_unique<BlackboardWorldStateDeterminer>(context_))
    , planner_(services_.planner_factory(*determiner_))
    , planning_system_(agent_->planning_system())
    , start_time_(Clock::now())
{
    // The pool running this process must not be owned by it
    services_.asyncer.reset();
}

AgentProcess::~AgentProcess() = default;

std::vector<ActionInvocation> AgentProcess::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

size_t AgentProcess::history_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

std::optional<plan::GoapWorldState> AgentProcess::last_world_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_world_state_;
}

std::optional<FailureInfo> AgentProcess::failure_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_info_;
}

plan::GoapGoalPtr AgentProcess::goal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return goal_;
}

Duration AgentProcess::running_time() const {
    return std::chrono::duration_cast<Duration>(Clock::now() - start_time_);
}

void AgentProcess::record_usage(int64_t tokens, double cost) {
    tokens_ += tokens;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cost_ += cost;
    }
    emit(ProcessEventType::UsageRecorded, "Usage recorded",
         Json{{"tokens", tokens}, {"cost", cost}, {"total_tokens", tokens_.load()}});
}

double AgentProcess::cost() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cost_;
}

AgentProcess& AgentProcess::run() {
    if (agent_->goals().empty()) {
        spdlog::info("Process {} has no goals", id_);
        throw UsageError(Error{ErrorCode::AgentHasNoGoals,
                               "Agent " + agent_->name() + " has no goals", id_});
    }

    // Claim the process; a concurrent run() sees RUNNING and backs off
    auto current = status_.load();
    do {
        if (current == AgentProcessStatus::Completed ||
            current == AgentProcessStatus::Killed ||
            current == AgentProcessStatus::Terminated) {
            spdlog::warn("Process {} already {}: not running again", id_, to_string(current));
            return *this;
        }
        if (current == AgentProcessStatus::Running) {
            spdlog::debug("Process {} is already running", id_);
            return *this;
        }
    } while (!status_.compare_exchange_strong(current, AgentProcessStatus::Running));

    // Main loop: budget check, then one tick
    auto policy = options_.termination_policy();
    while (status() == AgentProcessStatus::Running) {
        if (auto termination = policy->should_terminate(*this)) {
            spdlog::info("Process {} terminated by {}: {}", id_, termination->policy_name, termination->reason);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                failure_info_ = FailureInfo{termination->reason, std::nullopt, *termination};
            }
            if (update_status(AgentProcessStatus::Terminated)) {
                emit(ProcessEventType::EarlyTermination, termination->reason, termination->to_json());
            }
            return *this;
        }
        tick();
    }

    // Report how the loop ended
    switch (status()) {
        case AgentProcessStatus::Completed:
            emit(ProcessEventType::ProcessCompleted, "Process completed",
                 Json{{"running_time_ms", running_time().count()}});
            break;
        case AgentProcessStatus::Failed: {
            auto failure = failure_info();
            emit(ProcessEventType::ProcessFailed, failure ? failure->reason : std::string("Process failed"),
                 failure ? failure->to_json() : Json::object());
            break;
        }
        case AgentProcessStatus::Waiting:
            emit(ProcessEventType::ProcessWaiting, "Process waiting for a response");
            break;
        case AgentProcessStatus::Stuck:
            emit(ProcessEventType::ProcessStuck, "No plan to any goal");
            handle_stuck();
            break;
        case AgentProcessStatus::Paused:
            emit(ProcessEventType::ProcessPaused, "Action scheduled for later");
            handle_stuck();
            break;
        default:
            // Killed: the kill already emitted its event
            break;
    }
    return *this;
}

void AgentProcess::handle_stuck() {
    const auto& handler = agent_->stuck_handler();
    if (!handler) {
        spdlog::warn("Process {} is stuck: no handler", id_);
        return;
    }

    auto result = handler->handle_stuck(*this);
    emit(ProcessEventType::StuckHandlerResult, result.message, result.to_json());

    if (result.code == StuckHandlingResultCode::Replan) {
        spdlog::info("Process {} unstuck and will replan: {}", id_, result.message);
        run();
        return;
    }

    spdlog::warn("Process {} stuck: {}", id_, result.message);
    update_status(AgentProcessStatus::Stuck);
}

AgentProcess& AgentProcess::tick() {
    if (finished()) {
        spdlog::debug("Process {} already {}: tick ignored", id_, to_string(status()));
        return *this;
    }

    auto world_state = determiner_->determine_world_state();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_world_state_ = world_state;
    }
    emit(ProcessEventType::ReadyToPlan, "Ready to plan", world_state.to_json());
    spdlog::debug("Process {} tick (about to plan): {}, {}", id_, world_state.info_string(),
                  blackboard_->info_string());

    // Plan from scratch every tick
    auto plan = planner_->best_value_plan_to_any_goal(planning_system_);
    if (!plan) {
        spdlog::info("Process {} stuck: no plan to any goal from {}", id_, world_state.info_string());
        update_status(AgentProcessStatus::Stuck);
        return *this;
    }

    auto previous = goal();
    if (previous && previous->name() != plan->goal()->name()) {
        if (!options_.allow_goal_change) {
            fail_with_usage_error(Error{ErrorCode::GoalChangeNotAllowed,
                                        "Process cannot change goal from " + previous->name() +
                                        " to " + plan->goal()->name(),
                                        id_});
        }
        spdlog::info("Process {} changing goal from {} to {}", id_, previous->name(), plan->goal()->name());
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        goal_ = plan->goal();
    }

    if (plan->is_complete()) {
        spdlog::info("Process {} achieved goal {}", id_, plan->goal()->name());
        emit(ProcessEventType::GoalAchieved, "Goal " + plan->goal()->name() + " achieved",
             Json{{"goal", plan->goal()->name()}, {"world_state", world_state.to_json()}});
        update_status(AgentProcessStatus::Completed);
        return *this;
    }

    spdlog::debug("Process {} formulated plan: {}", id_, plan->info_string(options_.verbosity.show_planning));
    emit(ProcessEventType::PlanFormulated, plan->action_names(), plan->to_json());

    // Only the first step runs; the rest is replanned next tick
    const auto& action = find_action(plan->actions().front()->name());
    auto action_status = execute_action(action);

    switch (action_status.status) {
        case ActionStatusCode::Succeeded:
            update_status(AgentProcessStatus::Running);
            break;
        case ActionStatusCode::Failed: {
            auto error = action_status.error.value_or(Error{ErrorCode::ActionFailed, "Action failed", action.name()});
            {
                std::lock_guard<std::mutex> lock(mutex_);
                failure_info_ = FailureInfo{"Action " + action.name() + " failed: " + error.message, error, std::nullopt};
            }
            update_status(AgentProcessStatus::Failed);
            break;
        }
        case ActionStatusCode::Waiting:
            update_status(AgentProcessStatus::Waiting);
            break;
        case ActionStatusCode::Paused:
            update_status(AgentProcessStatus::Paused);
            break;
    }
    return *this;
}

const model::Action& AgentProcess::find_action(const std::string& name) {
    const model::Action* found = nullptr;
    int matches = 0;
    for (const auto& action : agent_->action_list()) {
        if (action->name() == name) {
            found = action.get();
            ++matches;
        }
    }
    if (matches > 1) {
        fail_with_usage_error(
            Error{ErrorCode::AmbiguousAction, "More than one action named " + name, id_});
    }
    if (!found) {
        fail_with_usage_error(
            Error{ErrorCode::ActionNotFound, "No action named " + name + " in agent " + agent_->name(), id_});
    }
    return *found;
}

model::ActionStatus AgentProcess::execute_action(const model::Action& action) {
    spdlog::debug("Process {} executing action {}", id_, action.name());
    emit(ProcessEventType::ActionExecutionStart, "Executing " + action.name(),
         Json{{"action", action.name()}});

    auto schedule = services_.operation_scheduler->schedule_action(action, options_);
    switch (schedule.kind) {
        case OperationSchedule::Kind::Pronto:
            break;
        case OperationSchedule::Kind::Delayed:
            spdlog::debug("Process {} delaying action {} by {}ms", id_, action.name(), schedule.delay.count());
            std::this_thread::sleep_for(schedule.delay);
            break;
        case OperationSchedule::Kind::Scheduled: {
            spdlog::info("Process {} action {} scheduled for later", id_, action.name());
            model::ActionStatus paused;
            paused.status = ActionStatusCode::Paused;
            return paused;
        }
    }

    // Recorded whatever the outcome
    auto timestamp = Clock::now();
    auto status = action.execute(context_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(ActionInvocation{action.name(), timestamp, status.running_time});
    }
    emit(ProcessEventType::ActionExecutionResult,
         action.name() + ": " + std::string(model::to_string(status.status)),
         Json{{"action", action.name()}, {"status", status.to_json()}});
    return status;
}

std::optional<event::ProcessEvent> AgentProcess::kill() {
    auto current = status_.load();
    do {
        if (is_finished(current)) {
            spdlog::debug("Process {} already {}: kill ignored", id_, to_string(current));
            return std::nullopt;
        }
    } while (!status_.compare_exchange_strong(current, AgentProcessStatus::Killed));

    spdlog::info("Process {} killed", id_);
    event::ProcessEvent event{ProcessEventType::ProcessKilled, id_, agent_->name(), "Process killed"};
    services_.event_listener->on_process_event(event);
    return event;
}

AgentProcess& AgentProcess::bind(const std::string& name, model::DomainObjectPtr value) {
    blackboard_->bind(name, value);
    emit(ProcessEventType::ObjectBound, "Bound " + name,
         Json{{"name", name}, {"value", value->to_json()}});
    return *this;
}

AgentProcess& AgentProcess::add_object(model::DomainObjectPtr value) {
    blackboard_->add_object(value);
    emit(ProcessEventType::ObjectAdded, "Added " + value->type_name(),
         Json{{"value", value->to_json()}});
    return *this;
}

model::ResponseImpact AgentProcess::respond(const model::Awaitable& awaitable, bool accepted) {
    auto impact = awaitable.on_response(accepted, *blackboard_);
    spdlog::info("Process {} received {} response to {}: blackboard {}", id_,
                 accepted ? "accepting" : "rejecting", awaitable.id(),
                 impact == model::ResponseImpact::Updated ? "updated" : "unchanged");
    return impact;
}

void AgentProcess::emit(ProcessEventType type, std::string message, Json metadata) {
    services_.event_listener->on_process_event(
        event::ProcessEvent{type, id_, agent_->name(), std::move(message), std::move(metadata)});
}

bool AgentProcess::update_status(AgentProcessStatus to) {
    auto current = status_.load();
    do {
        // Kill and termination win over anything in flight
        if (current == AgentProcessStatus::Killed || current == AgentProcessStatus::Terminated) {
            return false;
        }
    } while (!status_.compare_exchange_strong(current, to));
    return true;
}

void AgentProcess::fail_with_usage_error(Error error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_info_ = FailureInfo{error.message, error, std::nullopt};
    }
    if (update_status(AgentProcessStatus::Failed)) {
        emit(ProcessEventType::ProcessFailed, error.message, failure_info()->to_json());
    }
    throw UsageError(std::move(error));
}

Json AgentProcess::to_json() const {
    Json history = Json::array();
    for (const auto& invocation : this->history()) {
        history.push_back(invocation.to_json());
    }
    auto current_goal = goal();
    auto failure = failure_info();
    auto world_state = last_world_state();
    return Json{
        {"id", id_},
        {"parent_id", parent_id_ ? Json(*parent_id_) : Json()},
        {"agent", agent_->name()},
        {"status", std::string(to_string(status()))},
        {"goal", current_goal ? Json(current_goal->name()) : Json()},
        {"history", history},
        {"failure", failure ? failure->to_json() : Json()},
        {"world_state", world_state ? world_state->to_json() : Json()},
        {"start_time", to_epoch_millis(start_time_)},
        {"running_time_ms", running_time().count()},
        {"tokens", total_tokens()},
        {"cost", cost()},
        {"blackboard", blackboard_->to_json()}
    };
}

std::string AgentProcess::info_string() const {
    std::ostringstream ss;
    ss << "AgentProcess(id=" << id_
       << ", agent=" << agent_->name()
       << ", status=" << to_string(status())
       << ", actions=" << history_size() << ")";
    return ss.str();
}

}  // namespace goapagent::process
