#pragma once

#include "planner.hpp"

namespace goapagent::plan {

// A* search over world states.
// g = accumulated action cost, h = number of unsatisfied goal preconditions.
// The raw path is pruned backward from the goal, then forward from the start.
class AStarGoapPlanner : public OptimizingGoapPlanner {
public:
    explicit AStarGoapPlanner(WorldStateDeterminer& determiner, int max_iterations = 10000)
        : OptimizingGoapPlanner(determiner), max_iterations_(max_iterations) {}

protected:
    std::optional<GoapPlan> search(
        const GoapWorldState& start,
        const std::vector<GoapActionPtr>& actions,
        const GoapGoalPtr& goal) override;

private:
    int max_iterations_;

    static double heuristic(const GoapWorldState& state, const GoapGoal& goal);

    static std::vector<GoapActionPtr> backward_optimization(
        const std::vector<GoapActionPtr>& plan, const GoapGoal& goal);

    static std::vector<GoapActionPtr> forward_optimization(
        const std::vector<GoapActionPtr>& plan,
        const GoapWorldState& start,
        const GoapGoal& goal);

    static GoapWorldState simulate(const GoapWorldState& start,
                                   const std::vector<GoapActionPtr>& plan);
};

}  // namespace goapagent::plan
