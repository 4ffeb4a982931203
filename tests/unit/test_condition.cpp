#include <catch2/catch_test_macros.hpp>
#include "goapagent/model/condition.hpp"
#include "test_domain.hpp"

using namespace goapagent;
using namespace goapagent::model;
using namespace goapagent::testing;
using plan::ConditionDetermination;

namespace {

// Returns a fixed value and counts evaluations
class FixedCondition : public Condition {
public:
    FixedCondition(std::string name, ZeroToOne cost, ConditionDetermination value)
        : name_(std::move(name)), cost_(cost), value_(value) {}

    const std::string& name() const override { return name_; }
    ZeroToOne cost() const override { return cost_; }

    ConditionDetermination evaluate(process::ProcessContext&) const override {
        ++evaluations;
        return value_;
    }

    mutable int evaluations = 0;

private:
    std::string name_;
    ZeroToOne cost_;
    ConditionDetermination value_;
};

std::shared_ptr<FixedCondition> fixed(std::string name, ConditionDetermination value, ZeroToOne cost = 0.0) {
    return std::make_shared<FixedCondition>(std::move(name), cost, value);
}

}  // namespace

TEST_CASE("Computed condition reads the process", "[condition]") {
    auto listener = std::make_shared<EventSavingListener>();
    auto agent_process = make_process(frog_agent(), listener);
    auto has_person = ComputedBooleanCondition::create("hasPerson",
        [](process::ProcessContext& context, const Condition&) {
            return context.blackboard().count<Person>() > 0;
        });

    REQUIRE(has_person->evaluate(agent_process->context()) == ConditionDetermination::False);
    agent_process->add_object(std::make_shared<Person>("Rod"));
    REQUIRE(has_person->evaluate(agent_process->context()) == ConditionDetermination::True);
    REQUIRE(has_person->info_string().find("hasPerson") != std::string::npos);
}

TEST_CASE("Negation keeps unknown", "[condition]") {
    auto agent_process = make_process(frog_agent(), std::make_shared<EventSavingListener>());
    auto& context = agent_process->context();

    REQUIRE(not_condition(fixed("a", ConditionDetermination::True))->evaluate(context) == ConditionDetermination::False);
    REQUIRE(not_condition(fixed("a", ConditionDetermination::False))->evaluate(context) == ConditionDetermination::True);
    REQUIRE(not_condition(fixed("a", ConditionDetermination::Unknown))->evaluate(context) == ConditionDetermination::Unknown);
    REQUIRE(not_condition(fixed("a", ConditionDetermination::True))->name() == "!a");
}

TEST_CASE("Unknown test is true only for unknown", "[condition]") {
    auto agent_process = make_process(frog_agent(), std::make_shared<EventSavingListener>());
    auto& context = agent_process->context();

    REQUIRE(unknown_condition(fixed("a", ConditionDetermination::Unknown))->evaluate(context) == ConditionDetermination::True);
    REQUIRE(unknown_condition(fixed("a", ConditionDetermination::True))->evaluate(context) == ConditionDetermination::False);
    REQUIRE(unknown_condition(fixed("a", ConditionDetermination::False))->name() == "?a");
}

TEST_CASE("Conjunction", "[condition]") {
    auto agent_process = make_process(frog_agent(), std::make_shared<EventSavingListener>());
    auto& context = agent_process->context();
    auto t = fixed("t", ConditionDetermination::True);
    auto f = fixed("f", ConditionDetermination::False);
    auto u = fixed("u", ConditionDetermination::Unknown);

    REQUIRE(and_conditions(t, t)->evaluate(context) == ConditionDetermination::True);
    REQUIRE(and_conditions(t, f)->evaluate(context) == ConditionDetermination::False);
    REQUIRE(and_conditions(u, f)->evaluate(context) == ConditionDetermination::False);
    REQUIRE(and_conditions(t, u)->evaluate(context) == ConditionDetermination::Unknown);
    REQUIRE(and_conditions(t, f)->name() == "(t AND f)");
}

TEST_CASE("Disjunction", "[condition]") {
    auto agent_process = make_process(frog_agent(), std::make_shared<EventSavingListener>());
    auto& context = agent_process->context();
    auto t = fixed("t", ConditionDetermination::True);
    auto f = fixed("f", ConditionDetermination::False);
    auto u = fixed("u", ConditionDetermination::Unknown);

    REQUIRE(or_conditions(f, f)->evaluate(context) == ConditionDetermination::False);
    REQUIRE(or_conditions(f, t)->evaluate(context) == ConditionDetermination::True);
    REQUIRE(or_conditions(u, t)->evaluate(context) == ConditionDetermination::True);
    REQUIRE(or_conditions(f, u)->evaluate(context) == ConditionDetermination::Unknown);
    REQUIRE(or_conditions(f, t)->name() == "(f OR t)");
}

TEST_CASE("Cheaper operand short-circuits", "[condition]") {
    auto agent_process = make_process(frog_agent(), std::make_shared<EventSavingListener>());
    auto& context = agent_process->context();
    auto expensive = fixed("expensive", ConditionDetermination::True, 0.9);
    auto cheap = fixed("cheap", ConditionDetermination::False, 0.1);

    auto both = and_conditions(expensive, cheap);
    REQUIRE(both->cost() == 0.1);
    REQUIRE(both->evaluate(context) == ConditionDetermination::False);
    REQUIRE(cheap->evaluations == 1);
    REQUIRE(expensive->evaluations == 0);
}

TEST_CASE("Agent conditions feed the world state", "[condition]") {
    auto approved = ComputedBooleanCondition::create("approved",
        [](process::ProcessContext& context, const Condition&) {
            return context.blackboard().get_condition("manager_signed").value_or(false);
        });

    auto definition = quick_action("ship", {}, {}, [](process::ProcessContext& context) {
        context.blackboard().set_condition("shipped", true);
        return ActionResult::completed();
    });
    definition.pre = {"approved"};
    definition.post = {"shipped"};

    AgentDefinition agent_definition;
    agent_definition.name = "Shipper";
    agent_definition.actions = {Action::create(definition)};
    agent_definition.goals = {Goal::create("Ship", "Ship the order", {"shipped"})};
    agent_definition.conditions = {approved};
    auto agent = Agent::create(std::move(agent_definition));

    auto unapproved = make_process(agent, std::make_shared<EventSavingListener>());
    unapproved->run();
    REQUIRE(unapproved->status() == process::AgentProcessStatus::Stuck);
    REQUIRE(unapproved->last_world_state()->get("approved") == ConditionDetermination::False);

    auto signed_off = make_process(agent, std::make_shared<EventSavingListener>());
    signed_off->blackboard().set_condition("manager_signed", true);
    signed_off->run();
    REQUIRE(signed_off->status() == process::AgentProcessStatus::Completed);
    REQUIRE(signed_off->history_size() == 1);
}
