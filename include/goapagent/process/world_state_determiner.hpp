#pragma once

#include "process_context.hpp"
#include "goapagent/model/condition.hpp"
#include "goapagent/plan/planner.hpp"

#include <set>
#include <string>

namespace goapagent::process {

// Derives world state from a process blackboard and history:
//  - "name:Type" is TRUE when the variable resolves to a value of that type
//  - "hasRun_<action>" is TRUE when the action appears in history
//  - agent conditions named as the key, or ending in ".key", are evaluated
//  - anything else is an explicit blackboard flag; unset is FALSE
class BlackboardWorldStateDeterminer : public plan::WorldStateDeterminer {
public:
    explicit BlackboardWorldStateDeterminer(ProcessContext& context);

    plan::GoapWorldState determine_world_state() override;

    plan::ConditionDetermination determine_condition(const std::string& condition) override;

private:
    ProcessContext& context_;
    std::set<std::string> known_conditions_;

    model::ConditionPtr resolve_agent_condition(const std::string& condition) const;
};

}  // namespace goapagent::process
