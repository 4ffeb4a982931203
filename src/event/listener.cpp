#include "goapagent/event/listener.hpp"

#include <algorithm>

namespace goapagent::event {

std::string_view to_string(ProcessEventType type) {
    switch (type) {
        case ProcessEventType::ProcessCreated: return "process_created";
        case ProcessEventType::ReadyToPlan: return "ready_to_plan";
        case ProcessEventType::PlanFormulated: return "plan_formulated";
        case ProcessEventType::GoalAchieved: return "goal_achieved";
        case ProcessEventType::ActionExecutionStart: return "action_execution_start";
        case ProcessEventType::ActionExecutionResult: return "action_execution_result";
        case ProcessEventType::ObjectBound: return "object_bound";
        case ProcessEventType::ObjectAdded: return "object_added";
        case ProcessEventType::ProcessCompleted: return "process_completed";
        case ProcessEventType::ProcessFailed: return "process_failed";
        case ProcessEventType::ProcessWaiting: return "process_waiting";
        case ProcessEventType::ProcessStuck: return "process_stuck";
        case ProcessEventType::ProcessPaused: return "process_paused";
        case ProcessEventType::EarlyTermination: return "early_termination";
        case ProcessEventType::ProcessKilled: return "process_killed";
        case ProcessEventType::StuckHandlerResult: return "stuck_handler_result";
        case ProcessEventType::UsageRecorded: return "usage_recorded";
    }
    return "unknown";
}

std::string_view to_string(PlatformEventType type) {
    switch (type) {
        case PlatformEventType::AgentDeployed: return "agent_deployed";
        case PlatformEventType::PlatformReady: return "platform_ready";
    }
    return "unknown";
}

void MulticastEventListener::add(EventListenerPtr listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

std::vector<EventListenerPtr> MulticastEventListener::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_;
}

void MulticastEventListener::on_process_event(const ProcessEvent& event) {
    for (const auto& listener : snapshot()) {
        listener->on_process_event(event);
    }
}

void MulticastEventListener::on_platform_event(const PlatformEvent& event) {
    for (const auto& listener : snapshot()) {
        listener->on_platform_event(event);
    }
}

void LoggingEventListener::on_process_event(const ProcessEvent& event) {
    auto level = level_;
    switch (event.type) {
        case ProcessEventType::ProcessFailed:
        case ProcessEventType::ProcessStuck:
        case ProcessEventType::EarlyTermination:
        case ProcessEventType::ProcessKilled:
            level = std::max(level_, spdlog::level::warn);
            break;
        case ProcessEventType::ObjectBound:
        case ProcessEventType::ObjectAdded:
        case ProcessEventType::ReadyToPlan:
            level = std::min(level_, spdlog::level::debug);
            break;
        default:
            break;
    }
    spdlog::log(level, "[{}] {} {}: {}", event.process_id, event.agent_name,
                to_string(event.type), event.message);
}

void LoggingEventListener::on_platform_event(const PlatformEvent& event) {
    spdlog::log(level_, "[{}] {}: {}", event.platform_name, to_string(event.type), event.message);
}

}  // namespace goapagent::event
