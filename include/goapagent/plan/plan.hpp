#pragma once

#include "goap.hpp"

#include <string>
#include <vector>

namespace goapagent::plan {

// Ordered actions expected to reach a goal from a start state
class GoapPlan {
public:
    GoapPlan(std::vector<GoapActionPtr> actions, GoapGoalPtr goal, GoapWorldState world_state);

    const std::vector<GoapActionPtr>& actions() const { return actions_; }
    const GoapGoalPtr& goal() const { return goal_; }
    const GoapWorldState& world_state() const { return world_state_; }

    // The goal is already satisfied
    bool is_complete() const { return actions_.empty(); }

    double cost() const;
    double actions_value() const;

    // goal value + action values - action costs
    double net_value() const;

    // Action names joined with " -> "
    std::string action_names() const;

    std::string info_string(bool verbose = false) const;
    Json to_json() const;

private:
    std::vector<GoapActionPtr> actions_;
    GoapGoalPtr goal_;
    GoapWorldState world_state_;
};

}  // namespace goapagent::plan
