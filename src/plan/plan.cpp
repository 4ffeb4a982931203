#include "goapagent/plan/plan.hpp"

#include <spdlog/fmt/fmt.h>

namespace goapagent::plan {

GoapPlan::GoapPlan(std::vector<GoapActionPtr> actions, GoapGoalPtr goal, GoapWorldState world_state)
    : actions_(std::move(actions))
    , goal_(std::move(goal))
    , world_state_(std::move(world_state))
{
}

double GoapPlan::cost() const {
    double total = 0.0;
    for (const auto& action : actions_) {
        total += action->cost();
    }
    return total;
}

double GoapPlan::actions_value() const {
    double total = 0.0;
    for (const auto& action : actions_) {
        total += action->value();
    }
    return total;
}

double GoapPlan::net_value() const {
    return goal_->value() + actions_value() - cost();
}

std::string GoapPlan::action_names() const {
    std::string names;
    for (size_t i = 0; i < actions_.size(); ++i) {
        if (i > 0) {
            names += " -> ";
        }
        names += actions_[i]->name();
    }
    return names;
}

std::string GoapPlan::info_string(bool verbose) const {
    if (!verbose) {
        return fmt::format("{}; goal={}; netValue={:.2f}", action_names(), goal_->name(), net_value());
    }
    return fmt::format("{}; goal={}; cost={:.2f}; netValue={:.2f}; worldState={}",
                       action_names(), goal_->name(), cost(), net_value(), world_state_.info_string());
}

Json GoapPlan::to_json() const {
    Json actions = Json::array();
    for (const auto& action : actions_) {
        actions.push_back(action->name());
    }
    return Json{
        {"actions", actions},
        {"goal", goal_->name()},
        {"cost", cost()},
        {"net_value", net_value()},
        {"world_state", world_state_.to_json()}
    };
}

}  // namespace goapagent::plan
