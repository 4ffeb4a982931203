#pragma once

#include "action.hpp"
#include "condition.hpp"
#include "goal.hpp"
#include "schema_type.hpp"
#include "goapagent/blackboard/aggregation.hpp"
#include "goapagent/plan/goap.hpp"
#include "goapagent/process/stuck_handler.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace goapagent::model {

class Agent;

// Read view over actions, goals and conditions: one agent or a whole platform
class AgentScope {
public:
    virtual ~AgentScope() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual std::vector<ActionPtr> actions() const = 0;
    virtual std::vector<GoalPtr> goals() const = 0;
    virtual std::vector<ConditionPtr> conditions() const = 0;
    virtual std::vector<SchemaType> schema_types() const = 0;
    virtual blackboard::AggregationRegistry aggregations() const = 0;

    plan::GoapPlanningSystem planning_system() const;

    std::optional<SchemaType> resolve_schema_type(const std::string& name) const;

    // Agent with everything in this scope
    std::shared_ptr<const Agent> create_agent(std::string name,
                                              std::string provider,
                                              std::string version,
                                              std::string description) const;

    std::string info_string(bool verbose = false) const;
};

// Everything needed to build an Agent
struct AgentDefinition {
    std::string name;
    std::string provider;
    std::string version = "0.1.0";
    std::string description;
    std::vector<ActionPtr> actions;
    std::vector<GoalPtr> goals;
    std::vector<ConditionPtr> conditions;
    process::StuckHandlerPtr stuck_handler;
    blackboard::AggregationRegistry aggregations;
};

// Immutable agent. Schema types are inferred from the actions' bindings.
// Throws UsageError on duplicate action names.
class Agent : public AgentScope {
public:
    explicit Agent(AgentDefinition definition);

    static std::shared_ptr<const Agent> create(AgentDefinition definition) {
        return std::make_shared<const Agent>(std::move(definition));
    }

    std::string name() const override { return definition_.name; }
    std::string description() const override { return definition_.description; }
    std::vector<ActionPtr> actions() const override { return definition_.actions; }
    std::vector<GoalPtr> goals() const override { return definition_.goals; }
    std::vector<ConditionPtr> conditions() const override { return definition_.conditions; }
    std::vector<SchemaType> schema_types() const override { return schema_types_; }
    blackboard::AggregationRegistry aggregations() const override { return definition_.aggregations; }

    const std::string& provider() const { return definition_.provider; }
    const std::string& version() const { return definition_.version; }
    const process::StuckHandlerPtr& stuck_handler() const { return definition_.stuck_handler; }

    // Cheap accessors for hot paths
    const std::vector<ActionPtr>& action_list() const { return definition_.actions; }
    const std::vector<ConditionPtr>& condition_list() const { return definition_.conditions; }
    const blackboard::AggregationRegistry& aggregation_registry() const { return definition_.aggregations; }

    std::shared_ptr<const Agent> with_single_goal(GoalPtr goal) const;
    std::shared_ptr<const Agent> with_stuck_handler(process::StuckHandlerPtr handler) const;

    Json to_json() const;

private:
    AgentDefinition definition_;
    std::vector<SchemaType> schema_types_;
};

using AgentPtr = std::shared_ptr<const Agent>;

}  // namespace goapagent::model
