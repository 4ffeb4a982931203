#include "goapagent/model/agent.hpp"
#include "goapagent/core/errors.hpp"

#include <set>
#include <sstream>

namespace goapagent::model {

plan::GoapPlanningSystem AgentScope::planning_system() const {
    plan::GoapPlanningSystem system;
    for (const auto& action : actions()) {
        system.actions.push_back(action);
    }
    for (const auto& goal : goals()) {
        system.goals.push_back(goal);
    }
    return system;
}

std::optional<SchemaType> AgentScope::resolve_schema_type(const std::string& name) const {
    for (const auto& type : schema_types()) {
        if (type.name == name) {
            return type;
        }
    }
    return std::nullopt;
}

std::shared_ptr<const Agent> AgentScope::create_agent(std::string name,
                                                      std::string provider,
                                                      std::string version,
                                                      std::string description) const {
    AgentDefinition definition;
    definition.name = std::move(name);
    definition.provider = std::move(provider);
    definition.version = std::move(version);
    definition.description = std::move(description);
    definition.actions = actions();
    definition.goals = goals();
    definition.conditions = conditions();
    definition.aggregations = aggregations();
    return Agent::create(std::move(definition));
}

std::string AgentScope::info_string(bool verbose) const {
    std::ostringstream ss;
    ss << name() << ": " << description() << "\n";
    ss << indent("goals:", 1) << "\n";
    for (const auto& goal : goals()) {
        ss << indent(goal->name(), 2);
        if (verbose) {
            ss << " - " << goal->description();
        }
        ss << "\n";
    }
    ss << indent("actions:", 1) << "\n";
    for (const auto& action : actions()) {
        ss << indent(action->name(), 2);
        if (verbose) {
            ss << " - " << action->description();
        }
        ss << "\n";
    }
    ss << indent("conditions:", 1) << "\n";
    for (const auto& condition : conditions()) {
        ss << indent(condition->name(), 2) << "\n";
    }
    if (verbose) {
        ss << indent("schema types:", 1) << "\n";
        for (const auto& type : schema_types()) {
            ss << indent(type.info_string(), 2) << "\n";
        }
    }
    return ss.str();
}

Agent::Agent(AgentDefinition definition)
    : definition_(std::move(definition))
{
    std::set<std::string> names;
    std::vector<SchemaType> references;
    for (const auto& action : definition_.actions) {
        if (!names.insert(action->name()).second) {
            throw UsageError(Error{ErrorCode::DuplicateActionName,
                                   "Duplicate action name '" + action->name() + "'",
                                   definition_.name});
        }
        for (const auto& input : action->inputs()) {
            references.push_back(SchemaType{input.type(), action->referenced_input_properties(input.name())});
        }
        for (const auto& output : action->outputs()) {
            references.push_back(SchemaType{output.type(), {}});
        }
    }
    schema_types_ = merge_schema_types(references);
}

std::shared_ptr<const Agent> Agent::with_single_goal(GoalPtr goal) const {
    auto definition = definition_;
    definition.goals = {std::move(goal)};
    return Agent::create(std::move(definition));
}

std::shared_ptr<const Agent> Agent::with_stuck_handler(process::StuckHandlerPtr handler) const {
    auto definition = definition_;
    definition.stuck_handler = std::move(handler);
    return Agent::create(std::move(definition));
}

Json Agent::to_json() const {
    Json actions = Json::array();
    for (const auto& action : definition_.actions) {
        actions.push_back(action->to_json());
    }
    Json goals = Json::array();
    for (const auto& goal : definition_.goals) {
        goals.push_back(goal->to_json());
    }
    Json conditions = Json::array();
    for (const auto& condition : definition_.conditions) {
        conditions.push_back(condition->name());
    }
    Json schema_types = Json::array();
    for (const auto& type : schema_types_) {
        schema_types.push_back(type.to_json());
    }
    return Json{
        {"name", definition_.name},
        {"provider", definition_.provider},
        {"version", definition_.version},
        {"description", definition_.description},
        {"actions", actions},
        {"goals", goals},
        {"conditions", conditions},
        {"schema_types", schema_types},
        {"aggregations", definition_.aggregations.types()}
    };
}

}  // namespace goapagent::model
