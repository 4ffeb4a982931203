#include "goapagent/platform/platform_services.hpp"
#include "goapagent/plan/astar_planner.hpp"

namespace goapagent::platform {

RegistryToolGroupResolver::RegistryToolGroupResolver(std::vector<ToolGroup> groups) {
    for (auto& group : groups) {
        groups_[group.role] = std::move(group);
    }
}

Result<void, Error> RegistryToolGroupResolver::register_group(ToolGroup group) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (groups_.count(group.role) > 0) {
        return Result<void, Error>::err(ErrorCode::AlreadyExists,
                                        "Tool group already registered", group.role);
    }
    auto role = group.role;
    groups_[role] = std::move(group);
    return Result<void, Error>::ok();
}

std::optional<ToolGroup> RegistryToolGroupResolver::resolve(const std::string& role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = groups_.find(role);
    if (it == groups_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ToolGroup> RegistryToolGroupResolver::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolGroup> result;
    for (const auto& [role, group] : groups_) {
        result.push_back(group);
    }
    return result;
}

PlannerFactory astar_planner_factory(int max_iterations) {
    return [max_iterations](plan::WorldStateDeterminer& determiner) -> std::unique_ptr<plan::Planner> {
        return std::make_unique<plan::AStarGoapPlanner>(determiner, max_iterations);
    };
}

PlatformServices PlatformServices::with_defaults() const {
    PlatformServices services = *this;
    if (!services.event_listener) {
        services.event_listener = std::make_shared<event::NoOpEventListener>();
    }
    if (!services.tool_group_resolver) {
        services.tool_group_resolver = std::make_shared<RegistryToolGroupResolver>();
    }
    if (!services.operation_scheduler) {
        services.operation_scheduler = std::make_shared<process::ProntoOperationScheduler>();
    }
    if (!services.planner_factory) {
        services.planner_factory = astar_planner_factory();
    }
    return services;
}

}  // namespace goapagent::platform
