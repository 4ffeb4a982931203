#pragma once

#include "goapagent/core/types.hpp"
#include "goapagent/core/uuid.hpp"

#include <string>
#include <string_view>

namespace goapagent::event {

using namespace goapagent::core;

// Events emitted by an agent process
enum class ProcessEventType {
    ProcessCreated,
    ReadyToPlan,
    PlanFormulated,
    GoalAchieved,
    ActionExecutionStart,
    ActionExecutionResult,
    ObjectBound,
    ObjectAdded,
    ProcessCompleted,
    ProcessFailed,
    ProcessWaiting,
    ProcessStuck,
    ProcessPaused,
    EarlyTermination,
    ProcessKilled,
    StuckHandlerResult,
    UsageRecorded
};

// Events emitted by the platform itself
enum class PlatformEventType {
    AgentDeployed,
    PlatformReady
};

std::string_view to_string(ProcessEventType type);
std::string_view to_string(PlatformEventType type);

struct ProcessEvent {
    ProcessEventType type;
    ProcessId process_id;
    AgentName agent_name;
    std::string message;
    Json metadata = Json::object();
    TimePoint timestamp = Clock::now();
    std::string id = generate_event_id();

    Json to_json() const {
        return Json{
            {"id", id},
            {"type", std::string(to_string(type))},
            {"process_id", process_id},
            {"agent", agent_name},
            {"message", message},
            {"metadata", metadata},
            {"timestamp", to_epoch_millis(timestamp)}
        };
    }
};

struct PlatformEvent {
    PlatformEventType type;
    std::string platform_name;
    std::string message;
    Json metadata = Json::object();
    TimePoint timestamp = Clock::now();

    Json to_json() const {
        return Json{
            {"type", std::string(to_string(type))},
            {"platform", platform_name},
            {"message", message},
            {"metadata", metadata},
            {"timestamp", to_epoch_millis(timestamp)}
        };
    }
};

}  // namespace goapagent::event
