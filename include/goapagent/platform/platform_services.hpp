#pragma once

#include "goapagent/core/errors.hpp"
#include "goapagent/core/result.hpp"
#include "goapagent/core/types.hpp"
#include "goapagent/event/listener.hpp"
#include "goapagent/plan/planner.hpp"
#include "goapagent/process/operation_scheduler.hpp"

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace goapagent::platform {

using namespace goapagent::core;

// Tools granted to an action for one role, e.g. "web" or "math"
struct ToolGroup {
    std::string role;
    std::string description;
    std::vector<std::string> tools;

    Json to_json() const {
        return Json{{"role", role}, {"description", description}, {"tools", tools}};
    }
};

class ToolGroupResolver {
public:
    virtual ~ToolGroupResolver() = default;

    virtual std::optional<ToolGroup> resolve(const std::string& role) const = 0;
    virtual std::vector<ToolGroup> available() const = 0;
};

// Tool groups registered up front
class RegistryToolGroupResolver : public ToolGroupResolver {
public:
    RegistryToolGroupResolver() = default;
    explicit RegistryToolGroupResolver(std::vector<ToolGroup> groups);

    Result<void, Error> register_group(ToolGroup group);

    std::optional<ToolGroup> resolve(const std::string& role) const override;
    std::vector<ToolGroup> available() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ToolGroup> groups_;
};

struct LlmRequest {
    std::string prompt;
    std::string interaction_id;
    std::vector<ToolGroup> tool_groups;
};

struct LlmResponse {
    std::string text;
    int64_t prompt_tokens = 0;
    int64_t completion_tokens = 0;
    double cost = 0.0;

    int64_t total_tokens() const { return prompt_tokens + completion_tokens; }
};

// Text generation port. Usage is recorded on the calling process.
class LlmOperations {
public:
    virtual ~LlmOperations() = default;

    virtual Result<LlmResponse, Error> generate(const LlmRequest& request) = 0;
};

// Runs work off the calling thread
class Asyncer {
public:
    virtual ~Asyncer() = default;

    virtual std::future<void> async(std::function<void()> task) = 0;
};

using PlannerFactory =
    std::function<std::unique_ptr<plan::Planner>(plan::WorldStateDeterminer& determiner)>;

// A* planner bounded by `max_iterations`
PlannerFactory astar_planner_factory(int max_iterations = 10000);

// Collaborators shared by every process on a platform
struct PlatformServices {
    std::shared_ptr<event::AgenticEventListener> event_listener;
    std::shared_ptr<LlmOperations> llm_operations;
    std::shared_ptr<ToolGroupResolver> tool_group_resolver;
    // Used by the platform only; processes drop it
    std::shared_ptr<Asyncer> asyncer;
    std::shared_ptr<process::OperationScheduler> operation_scheduler;
    PlannerFactory planner_factory;

    // Fills every unset member except the asyncer with its default implementation
    PlatformServices with_defaults() const;
};

}  // namespace goapagent::platform
