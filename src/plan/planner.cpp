#include "goapagent/plan/planner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace goapagent::plan {

namespace {

class FromMapWorldStateDeterminer : public WorldStateDeterminer {
public:
    explicit FromMapWorldStateDeterminer(EffectSpec state) : state_(std::move(state)) {}

    GoapWorldState determine_world_state() override {
        return GoapWorldState(state_);
    }

    ConditionDetermination determine_condition(const std::string& condition) override {
        auto it = state_.find(condition);
        return it == state_.end() ? ConditionDetermination::Unknown : it->second;
    }

private:
    EffectSpec state_;
};

std::string plan_signature(const std::optional<GoapPlan>& plan) {
    return plan ? plan->action_names() : std::string("<none>");
}

}  // namespace

std::unique_ptr<WorldStateDeterminer> WorldStateDeterminer::from_map(EffectSpec state) {
    return std::make_unique<FromMapWorldStateDeterminer>(std::move(state));
}

std::optional<GoapPlan> Planner::plan_to_goal(
    const std::vector<GoapActionPtr>& actions,
    const GoapGoalPtr& goal) {

    return plan_from(world_state(), actions, goal);
}

std::vector<GoapPlan> Planner::plans_to_goals(const GoapPlanningSystem& system) {
    GoapWorldState start = world_state();

    std::vector<GoapPlan> plans;
    for (const auto& goal : system.goals) {
        auto plan = plan_from(start, system.actions, goal);
        if (plan) {
            plans.push_back(std::move(*plan));
        }
    }

    // Highest net value first; ties keep goal order
    std::stable_sort(plans.begin(), plans.end(), [](const GoapPlan& a, const GoapPlan& b) {
        return a.net_value() > b.net_value();
    });
    return plans;
}

std::optional<GoapPlan> Planner::best_value_plan_to_any_goal(const GoapPlanningSystem& system) {
    auto plans = plans_to_goals(system);
    if (plans.empty()) {
        return std::nullopt;
    }
    return std::move(plans.front());
}

GoapPlanningSystem Planner::prune(const GoapPlanningSystem& system) {
    auto plans = plans_to_goals(system);
    spdlog::info("{} plan(s) to consider in pruning", plans.size());

    GoapPlanningSystem pruned;
    pruned.goals = system.goals;
    for (const auto& action : system.actions) {
        bool used = std::any_of(plans.begin(), plans.end(), [&](const GoapPlan& plan) {
            return std::find(plan.actions().begin(), plan.actions().end(), action) != plan.actions().end();
        });
        if (used) {
            pruned.actions.push_back(action);
        }
    }
    return pruned;
}

GoapWorldState OptimizingGoapPlanner::world_state() {
    return determiner_.determine_world_state();
}

std::optional<GoapPlan> OptimizingGoapPlanner::plan_from(
    const GoapWorldState& start,
    const std::vector<GoapActionPtr>& actions,
    const GoapGoalPtr& goal) {

    GoapWorldState state = start;
    auto plan = search(state, actions, goal);

    // Resolve each unknown condition only if its value would change the plan
    for (const auto& condition : start.unknown_conditions()) {
        std::string direct = plan_signature(plan);
        bool differs = false;
        for (const auto& variant : state.variants(condition)) {
            if (plan_signature(search(variant, actions, goal)) != direct) {
                differs = true;
                break;
            }
        }

        if (differs) {
            auto determined = determiner_.determine_condition(condition);
            spdlog::debug("Condition {} determined as {} to choose between plans",
                          condition, to_string(determined));
            state = state.with(condition, determined);
            plan = search(state, actions, goal);
        }
    }

    return plan;
}

}  // namespace goapagent::plan
