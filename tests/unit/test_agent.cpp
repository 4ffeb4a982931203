#include <catch2/catch_test_macros.hpp>
#include "goapagent/model/agent.hpp"
#include "goapagent/model/awaitable.hpp"
#include "test_domain.hpp"

using namespace goapagent;
using namespace goapagent::model;
using namespace goapagent::testing;
using plan::ConditionDetermination;

TEST_CASE("Action preconditions and effects", "[agent][action]") {
    auto action = user_input_to_person();

    const auto& pre = action->preconditions();
    REQUIRE(pre.size() == 3);
    REQUIRE(pre.at("it:UserInput") == ConditionDetermination::True);
    REQUIRE(pre.at("it:Person") == ConditionDetermination::False);
    REQUIRE(pre.at("hasRun_userInputToPerson") == ConditionDetermination::False);

    const auto& effects = action->effects();
    REQUIRE(effects.size() == 2);
    REQUIRE(effects.at("it:Person") == ConditionDetermination::True);
    REQUIRE(effects.at("hasRun_userInputToPerson") == ConditionDetermination::True);
}

TEST_CASE("Rerunnable action has no run guard", "[agent][action]") {
    auto definition = quick_action("refine", {"Person"}, {"Person"}, nullptr);
    definition.can_rerun = true;
    definition.pre = {"draft"};
    definition.post = {"refined"};
    auto action = Action::create(definition);

    const auto& pre = action->preconditions();
    REQUIRE(pre.size() == 2);
    REQUIRE(pre.at("it:Person") == ConditionDetermination::True);
    REQUIRE(pre.at("draft") == ConditionDetermination::True);
    REQUIRE(action->effects().at("refined") == ConditionDetermination::True);
    REQUIRE(action->effects().at("hasRun_refine") == ConditionDetermination::True);
}

TEST_CASE("Output consumed as input is not required absent", "[agent][action]") {
    auto action = Action::create(quick_action("rename", {"Person"}, {"Person"}, nullptr));

    REQUIRE(action->preconditions().at("it:Person") == ConditionDetermination::True);
    REQUIRE(action->preconditions().at("hasRun_rename") == ConditionDetermination::False);
}

TEST_CASE("Action metadata", "[agent][action]") {
    auto definition = quick_action("lookup", {"customer:Person"}, {"Frog"}, nullptr);
    definition.description = "Look up a customer";
    definition.tool_groups = {"web"};
    auto action = Action::create(definition);

    auto metadata = action->metadata();
    REQUIRE(metadata.inputs == std::vector<std::string>{"customer:Person"});
    REQUIRE(metadata.outputs == std::vector<std::string>{"it:Frog"});
    REQUIRE(metadata.qos.max_attempts == 1);

    auto json = action->to_json();
    REQUIRE(json["name"] == "lookup");
    REQUIRE(json["tool_groups"][0] == "web");
}

TEST_CASE("Goal for an instance of a type", "[agent][goal]") {
    auto goal = Goal::create_instance("Create a frog", "Frog");

    REQUIRE(goal->name() == "Create Frog");
    REQUIRE(goal->output_type() == "Frog");
    REQUIRE(goal->preconditions().size() == 1);
    REQUIRE(goal->preconditions().at("it:Frog") == ConditionDetermination::True);

    auto stricter = goal->with_precondition("approved")->with_value(0.7);
    REQUIRE(stricter->preconditions().size() == 2);
    REQUIRE(stricter->value() == 0.7);
    REQUIRE(goal->value() == 0.0);
}

TEST_CASE("Schema types are inferred from bindings", "[agent]") {
    auto definition = quick_action("greet", {"customer:Person"}, {"Frog"}, nullptr);
    definition.input_properties["customer"] = {PropertyDefinition{"name", "string", "Full name"}};
    auto second = quick_action("describe", {"Person"}, {}, nullptr);
    second.input_properties["it"] = {PropertyDefinition{"name"}, PropertyDefinition{"age", "int"}};

    AgentDefinition agent_definition;
    agent_definition.name = "Greeter";
    agent_definition.actions = {Action::create(definition), Action::create(second)};
    agent_definition.goals = {Goal::create_instance("Create a frog", "Frog")};
    auto agent = Agent::create(std::move(agent_definition));

    auto types = agent->schema_types();
    REQUIRE(types.size() == 2);
    REQUIRE(types[0].name == "Frog");
    REQUIRE(types[0].properties.empty());
    REQUIRE(types[1].name == "Person");
    REQUIRE(types[1].properties.size() == 2);
    REQUIRE(types[1].properties[0].name == "name");
    REQUIRE(types[1].properties[1].name == "age");

    REQUIRE(agent->resolve_schema_type("Person"));
    REQUIRE_FALSE(agent->resolve_schema_type("Toad"));
}

TEST_CASE("Duplicate action names are rejected", "[agent]") {
    AgentDefinition definition;
    definition.name = "Twins";
    definition.actions = {user_input_to_person(), user_input_to_person()};

    try {
        Agent agent(std::move(definition));
        FAIL("Expected UsageError");
    } catch (const UsageError& e) {
        REQUIRE(e.error().code == ErrorCode::DuplicateActionName);
    }
}

TEST_CASE("Agent planning system and copies", "[agent]") {
    auto agent = frog_agent();

    auto system = agent->planning_system();
    REQUIRE(system.actions.size() == 2);
    REQUIRE(system.goals.size() == 1);
    REQUIRE(system.known_conditions().count("it:Frog") == 1);

    auto other_goal = Goal::create_instance("Create a person", "Person");
    auto narrowed = agent->with_single_goal(other_goal);
    REQUIRE(narrowed->goals().size() == 1);
    REQUIRE(narrowed->goals().front()->name() == "Create Person");
    REQUIRE(agent->goals().front()->name() == "Create Frog");

    auto copy = agent->create_agent("Copy", "tests", "2.0.0", "A copy");
    REQUIRE(copy->name() == "Copy");
    REQUIRE(copy->version() == "2.0.0");
    REQUIRE(copy->action_list().size() == 2);

    auto json = agent->to_json();
    REQUIRE(json["name"] == "Frogger");
    REQUIRE(json["actions"].size() == 2);
    REQUIRE(agent->info_string().find("userInputToPerson") != std::string::npos);
}

TEST_CASE("Confirmation request adds its payload when accepted", "[agent][awaitable]") {
    blackboard::InMemoryBlackboard blackboard;
    auto request = std::make_shared<ConfirmationRequest>(std::make_shared<Person>("Rod"), "Is this Rod?");

    REQUIRE(request->satisfies_type("Awaitable"));
    REQUIRE(request->message() == "Is this Rod?");
    REQUIRE_FALSE(request->id().empty());

    REQUIRE(request->on_response(false, blackboard) == ResponseImpact::Unchanged);
    REQUIRE(blackboard.count<Person>() == 0);

    REQUIRE(request->on_response(true, blackboard) == ResponseImpact::Updated);
    REQUIRE(blackboard.last<Person>()->name() == "Rod");
}

TEST_CASE("Retry template stops on success", "[agent][qos]") {
    struct Outcome {
        bool failed;
        bool is_failure() const { return failed; }
    };

    RetryTemplate retry(4, Duration(0), 2.0, Duration(0));
    int calls = 0;
    auto outcome = retry.execute([&calls](int attempt) {
        ++calls;
        return Outcome{attempt < 3};
    });

    REQUIRE_FALSE(outcome.is_failure());
    REQUIRE(calls == 3);

    calls = 0;
    auto exhausted = retry.execute([&calls](int) {
        ++calls;
        return Outcome{true};
    });
    REQUIRE(exhausted.is_failure());
    REQUIRE(calls == 4);
}
