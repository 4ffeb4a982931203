#pragma once

#include "plan.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace goapagent::plan {

// Source of world state for the planner
class WorldStateDeterminer {
public:
    virtual ~WorldStateDeterminer() = default;

    // May leave expensive conditions UNKNOWN for the planner to resolve lazily
    virtual GoapWorldState determine_world_state() = 0;

    // Evaluate one condition precisely, without caching
    virtual ConditionDetermination determine_condition(const std::string& condition) = 0;

    // Fixed world state; conditions missing from the map are UNKNOWN
    static std::unique_ptr<WorldStateDeterminer> from_map(EffectSpec state);
};

// Planner port
class Planner {
public:
    virtual ~Planner() = default;

    virtual GoapWorldState world_state() = 0;

    // Plan from a given start state. nullopt when the goal is unreachable.
    virtual std::optional<GoapPlan> plan_from(
        const GoapWorldState& start,
        const std::vector<GoapActionPtr>& actions,
        const GoapGoalPtr& goal) = 0;

    // Plan from the current world state
    std::optional<GoapPlan> plan_to_goal(
        const std::vector<GoapActionPtr>& actions,
        const GoapGoalPtr& goal);

    // One plan per reachable goal, highest net value first
    std::vector<GoapPlan> plans_to_goals(const GoapPlanningSystem& system);

    std::optional<GoapPlan> best_value_plan_to_any_goal(const GoapPlanningSystem& system);

    // Copy of the system keeping only actions used by some plan
    GoapPlanningSystem prune(const GoapPlanningSystem& system);
};

// Re-plans with precise values when an UNKNOWN condition could change the outcome
class OptimizingGoapPlanner : public Planner {
public:
    explicit OptimizingGoapPlanner(WorldStateDeterminer& determiner)
        : determiner_(determiner) {}

    GoapWorldState world_state() override;

    std::optional<GoapPlan> plan_from(
        const GoapWorldState& start,
        const std::vector<GoapActionPtr>& actions,
        const GoapGoalPtr& goal) final;

protected:
    virtual std::optional<GoapPlan> search(
        const GoapWorldState& start,
        const std::vector<GoapActionPtr>& actions,
        const GoapGoalPtr& goal) = 0;

private:
    WorldStateDeterminer& determiner_;
};

}  // namespace goapagent::plan
