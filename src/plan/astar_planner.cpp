#include "goapagent/plan/astar_planner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <map>
#include <queue>
#include <set>

namespace goapagent::plan {

namespace {

struct SearchNode {
    GoapWorldState state;
    double g_score;
    double f_score;
    uint64_t sequence;  // FIFO among equal f scores
};

struct NodeOrder {
    bool operator()(const SearchNode& a, const SearchNode& b) const {
        if (a.f_score != b.f_score) {
            return a.f_score > b.f_score;
        }
        return a.sequence > b.sequence;
    }
};

}  // namespace

double AStarGoapPlanner::heuristic(const GoapWorldState& state, const GoapGoal& goal) {
    double unsatisfied = 0.0;
    for (const auto& [key, value] : goal.preconditions()) {
        auto current = state.get(key);
        if (!current || *current != value) {
            unsatisfied += 1.0;
        }
    }
    return unsatisfied;
}

std::optional<GoapPlan> AStarGoapPlanner::search(
    const GoapWorldState& start,
    const std::vector<GoapActionPtr>& actions,
    const GoapGoalPtr& goal) {

    std::priority_queue<SearchNode, std::vector<SearchNode>, NodeOrder> open;
    std::map<GoapWorldState, double> g_scores;
    std::map<GoapWorldState, std::pair<GoapWorldState, GoapActionPtr>> came_from;
    std::set<GoapWorldState> closed;
    uint64_t sequence = 0;

    auto g_of = [&g_scores](const GoapWorldState& state) {
        auto it = g_scores.find(state);
        return it == g_scores.end() ? std::numeric_limits<double>::max() : it->second;
    };

    g_scores[start] = 0.0;
    open.push(SearchNode{start, 0.0, heuristic(start, *goal), sequence++});

    std::optional<SearchNode> best_goal;
    int iterations = 0;

    while (!open.empty() && iterations < max_iterations_) {
        ++iterations;
        SearchNode current = open.top();
        open.pop();

        if (best_goal && current.g_score >= best_goal->g_score) {
            continue;
        }
        if (closed.count(current.state)) {
            continue;
        }
        closed.insert(current.state);

        if (goal->is_achievable(current.state)) {
            if (!best_goal || current.g_score < best_goal->g_score) {
                best_goal = current;
            }
            continue;
        }

        for (const auto& action : actions) {
            if (!action->is_achievable(current.state)) {
                continue;
            }

            GoapWorldState next = current.state.apply(action->effects());
            if (next == current.state) {
                continue;
            }

            double tentative = g_of(current.state) + action->cost();
            if (best_goal && tentative >= best_goal->g_score) {
                continue;
            }

            if (tentative < g_of(next)) {
                came_from.insert_or_assign(next, std::make_pair(current.state, action));
                g_scores[next] = tentative;
                // A cheaper path reopens a closed state
                closed.erase(next);
                open.push(SearchNode{next, tentative, tentative + heuristic(next, *goal), sequence++});
            }
        }
    }

    if (iterations >= max_iterations_) {
        spdlog::warn("A* search for goal {} stopped after {} iterations", goal->name(), iterations);
    }

    if (!best_goal) {
        return std::nullopt;
    }

    std::vector<GoapActionPtr> path;
    GoapWorldState cursor = best_goal->state;
    for (auto it = came_from.find(cursor); it != came_from.end(); it = came_from.find(cursor)) {
        path.push_back(it->second.second);
        cursor = it->second.first;
    }
    std::reverse(path.begin(), path.end());

    auto optimized = backward_optimization(path, *goal);
    auto final_plan = forward_optimization(optimized, start, *goal);

    return GoapPlan(std::move(final_plan), goal, start);
}

std::vector<GoapActionPtr> AStarGoapPlanner::backward_optimization(
    const std::vector<GoapActionPtr>& plan, const GoapGoal& goal) {

    if (plan.empty()) {
        return plan;
    }

    EffectSpec targets = goal.preconditions();
    std::vector<GoapActionPtr> kept;

    for (auto it = plan.rbegin(); it != plan.rend(); ++it) {
        const auto& action = *it;
        bool necessary = false;

        for (const auto& [key, value] : action->effects()) {
            auto target = targets.find(key);
            if (target != targets.end() && target->second == value) {
                necessary = true;
                targets.erase(target);
                for (const auto& [pre_key, pre_value] : action->preconditions()) {
                    targets[pre_key] = pre_value;
                }
            }
        }

        if (necessary) {
            kept.push_back(action);
        }
    }

    std::reverse(kept.begin(), kept.end());
    return kept;
}

std::vector<GoapActionPtr> AStarGoapPlanner::forward_optimization(
    const std::vector<GoapActionPtr>& plan,
    const GoapWorldState& start,
    const GoapGoal& goal) {

    if (plan.empty()) {
        return plan;
    }

    std::vector<GoapActionPtr> optimized;
    GoapWorldState current = start;
    const auto& required = goal.preconditions();

    for (const auto& action : plan) {
        if (!action->is_achievable(current)) {
            continue;
        }

        GoapWorldState next = current.apply(action->effects());
        bool progress = false;
        if (next != current) {
            for (const auto& [key, value] : action->effects()) {
                auto req = required.find(key);
                if (req == required.end()) {
                    continue;
                }
                if (current.get(key) != req->second && value == req->second) {
                    progress = true;
                    break;
                }
            }
        }

        if (progress) {
            optimized.push_back(action);
            current = next;
        }
    }

    // Too aggressive: fall back to the input plan
    if (!goal.is_achievable(simulate(start, optimized))) {
        return plan;
    }
    return optimized;
}

GoapWorldState AStarGoapPlanner::simulate(const GoapWorldState& start,
                                          const std::vector<GoapActionPtr>& plan) {
    GoapWorldState current = start;
    for (const auto& action : plan) {
        if (action->is_achievable(current)) {
            current = current.apply(action->effects());
        }
    }
    return current;
}

}  // namespace goapagent::plan
