#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "goapagent/plan/astar_planner.hpp"
#include "goapagent/plan/goap.hpp"

using namespace goapagent::plan;

namespace {

constexpr auto T = ConditionDetermination::True;
constexpr auto F = ConditionDetermination::False;
constexpr auto U = ConditionDetermination::Unknown;

// Fixed state that counts precise lookups
class CountingDeterminer : public WorldStateDeterminer {
public:
    CountingDeterminer(EffectSpec state, EffectSpec actual)
        : state_(std::move(state)), actual_(std::move(actual)) {}

    GoapWorldState determine_world_state() override { return GoapWorldState(state_); }

    ConditionDetermination determine_condition(const std::string& condition) override {
        ++lookups;
        auto it = actual_.find(condition);
        return it == actual_.end() ? U : it->second;
    }

    int lookups = 0;

private:
    EffectSpec state_;
    EffectSpec actual_;
};

}  // namespace

TEST_CASE("Plans a chain of actions", "[planner]") {
    auto determiner = WorldStateDeterminer::from_map({{"hasA", F}, {"hasB", F}, {"done", F}});
    AStarGoapPlanner planner(*determiner);

    std::vector<GoapActionPtr> actions{
        SimpleGoapAction::create("bToDone", {"hasB"}, {"done"}),
        SimpleGoapAction::create("getA", {}, {"hasA"}),
        SimpleGoapAction::create("aToB", {"hasA"}, {"hasB"})
    };
    auto plan = planner.plan_to_goal(actions, SimpleGoapGoal::create("finish", {"done"}));

    REQUIRE(plan);
    REQUIRE(plan->action_names() == "getA -> aToB -> bToDone");
    REQUIRE_FALSE(plan->is_complete());
}

TEST_CASE("Prefers the cheaper route", "[planner]") {
    auto determiner = WorldStateDeterminer::from_map({{"done", F}});
    AStarGoapPlanner planner(*determiner);

    std::vector<GoapActionPtr> actions{
        SimpleGoapAction::create("expensive", {}, {"done"}, 0.9),
        SimpleGoapAction::create("cheap", {}, {"done"}, 0.1)
    };
    auto plan = planner.plan_to_goal(actions, SimpleGoapGoal::create("finish", {"done"}, 0.5));

    REQUIRE(plan);
    REQUIRE(plan->action_names() == "cheap");
    REQUIRE_THAT(plan->cost(), Catch::Matchers::WithinAbs(0.1, 1e-9));
    REQUIRE_THAT(plan->net_value(), Catch::Matchers::WithinAbs(0.4, 1e-9));
}

TEST_CASE("Satisfied goal gives a complete plan", "[planner]") {
    auto determiner = WorldStateDeterminer::from_map({{"done", T}});
    AStarGoapPlanner planner(*determiner);

    std::vector<GoapActionPtr> actions{SimpleGoapAction::create("finish", {}, {"done"})};
    auto plan = planner.plan_to_goal(actions, SimpleGoapGoal::create("finish", {"done"}));

    REQUIRE(plan);
    REQUIRE(plan->is_complete());
    REQUIRE(plan->actions().empty());
}

TEST_CASE("Unreachable goal has no plan", "[planner]") {
    auto determiner = WorldStateDeterminer::from_map({{"done", F}, {"zorp", F}});
    AStarGoapPlanner planner(*determiner);

    std::vector<GoapActionPtr> actions{SimpleGoapAction::create("finish", {}, {"done"})};

    REQUIRE_FALSE(planner.plan_to_goal(actions, SimpleGoapGoal::create("zorp", {"zorp"})));
}

TEST_CASE("Conditions missing from the state never satisfy", "[planner]") {
    auto determiner = WorldStateDeterminer::from_map({});
    AStarGoapPlanner planner(*determiner);

    std::vector<GoapActionPtr> actions{SimpleGoapAction::create("useKey", {"hasKey"}, {"open"})};

    REQUIRE_FALSE(planner.plan_to_goal(actions, SimpleGoapGoal::create("open", {"open"})));
}

TEST_CASE("Plans are ordered by net value", "[planner]") {
    auto determiner = WorldStateDeterminer::from_map({{"x", F}, {"y", F}});
    AStarGoapPlanner planner(*determiner);

    GoapPlanningSystem system{
        {SimpleGoapAction::create("makeX", {}, {"x"}), SimpleGoapAction::create("makeY", {}, {"y"})},
        {SimpleGoapGoal::create("low", {"x"}, 0.2), SimpleGoapGoal::create("high", {"y"}, 0.8)}
    };

    auto plans = planner.plans_to_goals(system);
    REQUIRE(plans.size() == 2);
    REQUIRE(plans[0].goal()->name() == "high");
    REQUIRE(plans[1].goal()->name() == "low");

    auto best = planner.best_value_plan_to_any_goal(system);
    REQUIRE(best);
    REQUIRE(best->action_names() == "makeY");
}

TEST_CASE("Prune keeps only actions some plan uses", "[planner]") {
    auto determiner = WorldStateDeterminer::from_map({{"x", F}, {"z", F}});
    AStarGoapPlanner planner(*determiner);

    GoapPlanningSystem system{
        {SimpleGoapAction::create("makeX", {}, {"x"}), SimpleGoapAction::create("useZ", {"z"}, {"w"})},
        {SimpleGoapGoal::create("getX", {"x"})}
    };

    auto pruned = planner.prune(system);
    REQUIRE(pruned.actions.size() == 1);
    REQUIRE(pruned.actions.front()->name() == "makeX");
    REQUIRE(pruned.goals.size() == 1);
}

TEST_CASE("Unknown conditions are resolved only when they matter", "[planner]") {
    CountingDeterminer determiner({{"raining", U}, {"windy", U}, {"dry", F}},
                                  {{"raining", T}, {"windy", F}});
    AStarGoapPlanner planner(determiner);

    std::vector<GoapActionPtr> actions{
        std::make_shared<SimpleGoapAction>("stayIn", EffectSpec{{"raining", T}}, EffectSpec{{"dry", T}}, 0.1),
        std::make_shared<SimpleGoapAction>("walkHome", EffectSpec{{"raining", F}}, EffectSpec{{"dry", T}}, 0.5)
    };
    auto plan = planner.plan_to_goal(actions, SimpleGoapGoal::create("stayDry", {"dry"}));

    REQUIRE(plan);
    REQUIRE(plan->action_names() == "stayIn");
    REQUIRE(determiner.lookups == 1);
}

TEST_CASE("Known conditions of a planning system", "[planner]") {
    GoapPlanningSystem system{
        {SimpleGoapAction::create("aToB", {"a"}, {"b"})},
        {SimpleGoapGoal::create("getC", {"c"})}
    };

    REQUIRE(system.known_preconditions() == std::set<std::string>{"a"});
    REQUIRE(system.known_effects() == std::set<std::string>{"b"});
    REQUIRE(system.known_conditions() == std::set<std::string>{"a", "b", "c"});
}

TEST_CASE("World state variants and updates", "[planner]") {
    GoapWorldState state({{"a", U}, {"b", T}});

    REQUIRE(state.unknown_conditions() == std::vector<std::string>{"a"});

    auto variants = state.variants("a");
    REQUIRE(variants.size() == 2);
    REQUIRE(variants[0].get("a") == T);
    REQUIRE(variants[1].get("a") == F);

    auto applied = state.apply({{"a", T}, {"c", F}});
    REQUIRE(applied.get("c") == F);
    REQUIRE(applied.satisfies({{"a", T}, {"b", T}}));
    REQUIRE_FALSE(state.satisfies({{"missing", F}}));
}
