#include <catch2/catch_test_macros.hpp>
#include "goapagent/process/agent_process.hpp"
#include "goapagent/process/stuck_handler.hpp"
#include "test_domain.hpp"

#include <atomic>
#include <stdexcept>

using namespace goapagent;
using namespace goapagent::model;
using namespace goapagent::process;
using namespace goapagent::testing;
using event::ProcessEventType;

namespace {

// Keeps acting without ever reaching "done"
AgentPtr spinning_agent() {
    auto definition = quick_action("spin", {}, {}, [](ProcessContext&) {
        return ActionResult::completed();
    });
    definition.post = {"done"};
    definition.can_rerun = true;

    AgentDefinition agent_definition;
    agent_definition.name = "Spinner";
    agent_definition.actions = {Action::create(definition)};
    agent_definition.goals = {Goal::create("Finish", "Get it done", {"done"})};
    return Agent::create(std::move(agent_definition));
}

// Asks for confirmation before producing a Person
AgentPtr confirming_agent() {
    AgentDefinition definition;
    definition.name = "Confirmer";
    definition.actions = {Action::create(quick_action("confirmPerson", {"UserInput"}, {"Person"},
        [](ProcessContext& context) {
            auto input = context.blackboard().last<UserInput>();
            return ActionResult::waiting(std::make_shared<ConfirmationRequest>(
                std::make_shared<Person>(input->content()), "Is this the right person?"));
        }))};
    definition.goals = {Goal::create_instance("Create a person", Person::kTypeName)};
    return Agent::create(std::move(definition));
}

// Pursues G1 first; running "setup" makes only G2 reachable
AgentPtr goal_switching_agent() {
    auto setup = quick_action("setup", {}, {}, [](ProcessContext& context) {
        context.blackboard().set_condition("g2", true);
        return ActionResult::completed();
    });
    setup.post = {"g1"};

    AgentDefinition definition;
    definition.name = "Switcher";
    definition.actions = {Action::create(setup)};
    definition.goals = {
        Goal::create("G1", "Preferred", {"g1"}, {}, std::nullopt, 1.0),
        Goal::create("G2", "Fallback", {"g2"}, {}, std::nullopt, 0.5)
    };
    return Agent::create(std::move(definition));
}

class AddInputStuckHandler : public StuckHandler {
public:
    StuckHandlerResult handle_stuck(AgentProcess& agent_process) override {
        ++calls;
        agent_process.add_object(std::make_shared<UserInput>("rescued"));
        return StuckHandlerResult{"Added user input", StuckHandlingResultCode::Replan};
    }

    int calls = 0;
};

class GiveUpStuckHandler : public StuckHandler {
public:
    explicit GiveUpStuckHandler(std::string message) : message_(std::move(message)) {}

    StuckHandlerResult handle_stuck(AgentProcess&) override {
        return StuckHandlerResult{message_, StuckHandlingResultCode::NoResolution};
    }

private:
    std::string message_;
};

// Defers every action
class LaterOperationScheduler : public OperationScheduler {
public:
    OperationSchedule schedule_action(const Action&, const ProcessOptions&) override {
        return OperationSchedule::scheduled(Clock::now() + std::chrono::hours(1));
    }
};

}  // namespace

TEST_CASE("Two actions reach the goal", "[agent_process]") {
    auto listener = std::make_shared<EventSavingListener>();
    auto agent_process = make_process(frog_agent(), listener);
    agent_process->add_object(std::make_shared<UserInput>("Kermit"));

    REQUIRE(agent_process->status() == AgentProcessStatus::NotStarted);
    agent_process->run();

    REQUIRE(agent_process->status() == AgentProcessStatus::Completed);
    REQUIRE(agent_process->finished());
    auto history = agent_process->history();
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].action_name == "userInputToPerson");
    REQUIRE(history[1].action_name == "personToFrog");
    REQUIRE(agent_process->goal()->name() == "Create Frog");

    auto frog = agent_process->result_of_type<Frog>();
    REQUIRE(frog);
    REQUIRE(frog->name() == "Kermit");

    REQUIRE(listener->count(ProcessEventType::ObjectAdded) == 3);
    REQUIRE(listener->count(ProcessEventType::PlanFormulated) == 2);
    REQUIRE(listener->count(ProcessEventType::ActionExecutionStart) == 2);
    REQUIRE(listener->count(ProcessEventType::ActionExecutionResult) == 2);
    REQUIRE(listener->count(ProcessEventType::GoalAchieved) == 1);
    REQUIRE(listener->count(ProcessEventType::ProcessCompleted) == 1);
    REQUIRE(listener->process_events().back().type == ProcessEventType::ProcessCompleted);
}

TEST_CASE("Result is only available once completed", "[agent_process]") {
    auto agent_process = make_process(frog_agent(), std::make_shared<EventSavingListener>());
    agent_process->add_object(std::make_shared<Frog>("Early"));

    REQUIRE(agent_process->result_of_type<Frog>() == nullptr);
}

TEST_CASE("Unreachable goal leaves the process stuck", "[agent_process]") {
    AgentDefinition definition;
    definition.name = "Zorper";
    definition.actions = {user_input_to_person()};
    definition.goals = {Goal::create_instance("Create a zorp", "Zorp")};
    auto listener = std::make_shared<EventSavingListener>();
    auto agent_process = make_process(Agent::create(std::move(definition)), listener);
    agent_process->add_object(std::make_shared<UserInput>("hello"));

    agent_process->run();

    REQUIRE(agent_process->status() == AgentProcessStatus::Stuck);
    REQUIRE_FALSE(agent_process->finished());
    REQUIRE(agent_process->history_size() == 0);
    REQUIRE(listener->count(ProcessEventType::ProcessStuck) == 1);
    REQUIRE(agent_process->last_world_state()->get("it:Zorp") == plan::ConditionDetermination::False);
}

TEST_CASE("Budget stops a process that never finishes", "[agent_process][budget]") {
    auto listener = std::make_shared<EventSavingListener>();
    auto options = test_options();
    options.budget.actions = 5;
    auto agent_process = make_process(spinning_agent(), listener, options);

    agent_process->run();

    REQUIRE(agent_process->status() == AgentProcessStatus::Terminated);
    REQUIRE(agent_process->history_size() == 5);
    auto failure = agent_process->failure_info();
    REQUIRE(failure);
    REQUIRE(failure->reason == "Max actions reached");
    REQUIRE(failure->termination);
    REQUIRE(failure->termination->policy_name.find("MaxActions(5)") != std::string::npos);
    REQUIRE(listener->count(ProcessEventType::EarlyTermination) == 1);
}

TEST_CASE("Control policy replaces the budget", "[agent_process][budget]") {
    auto options = test_options();
    auto max_one = EarlyTerminationPolicy::max_actions(1);
    options.control.early_termination_policy = max_one;
    auto agent_process = make_process(spinning_agent(), std::make_shared<EventSavingListener>(), options);

    agent_process->run();

    REQUIRE(agent_process->status() == AgentProcessStatus::Terminated);
    REQUIRE(agent_process->history_size() == 1);
    REQUIRE(agent_process->failure_info()->termination->policy == max_one);
}

TEST_CASE("Running a finished process does nothing", "[agent_process]") {
    auto listener = std::make_shared<EventSavingListener>();
    auto agent_process = make_process(frog_agent(), listener);
    agent_process->add_object(std::make_shared<UserInput>("Kermit"));
    agent_process->run();
    auto events = listener->process_events().size();

    agent_process->run();
    agent_process->tick();

    REQUIRE(agent_process->status() == AgentProcessStatus::Completed);
    REQUIRE(agent_process->history_size() == 2);
    REQUIRE(listener->process_events().size() == events);
}

TEST_CASE("Awaitable pauses until a response arrives", "[agent_process][awaitable]") {
    auto listener = std::make_shared<EventSavingListener>();
    auto agent_process = make_process(confirming_agent(), listener);
    agent_process->add_object(std::make_shared<UserInput>("Rod"));

    agent_process->run();

    REQUIRE(agent_process->status() == AgentProcessStatus::Waiting);
    REQUIRE(listener->count(ProcessEventType::ProcessWaiting) == 1);
    auto awaitable = agent_process->blackboard().last<Awaitable>();
    REQUIRE(awaitable);
    REQUIRE(awaitable->message() == "Is this the right person?");

    REQUIRE(agent_process->respond(*awaitable, true) == ResponseImpact::Updated);
    agent_process->run();

    REQUIRE(agent_process->status() == AgentProcessStatus::Completed);
    REQUIRE(agent_process->history_size() == 1);
    REQUIRE(agent_process->result_of_type<Person>()->name() == "Rod");
}

TEST_CASE("Rejected awaitable leaves nothing to do", "[agent_process][awaitable]") {
    auto agent_process = make_process(confirming_agent(), std::make_shared<EventSavingListener>());
    agent_process->add_object(std::make_shared<UserInput>("Rod"));
    agent_process->run();

    auto awaitable = agent_process->blackboard().last<Awaitable>();
    REQUIRE(agent_process->respond(*awaitable, false) == ResponseImpact::Unchanged);
    agent_process->run();

    REQUIRE(agent_process->status() == AgentProcessStatus::Stuck);
    REQUIRE(agent_process->blackboard().count<Person>() == 0);
}

TEST_CASE("Action that ran once cannot run again", "[agent_process]") {
    auto definition = quick_action("once", {}, {}, [](ProcessContext&) {
        return ActionResult::completed();
    });
    definition.post = {"flagged"};

    AgentDefinition agent_definition;
    agent_definition.name = "Once";
    agent_definition.actions = {Action::create(definition)};
    agent_definition.goals = {Goal::create("Flag", "Set the flag", {"flagged"})};
    auto agent_process = make_process(Agent::create(std::move(agent_definition)),
                                      std::make_shared<EventSavingListener>());

    agent_process->run();

    REQUIRE(agent_process->status() == AgentProcessStatus::Stuck);
    REQUIRE(agent_process->history_size() == 1);
    REQUIRE(agent_process->last_world_state()->get("hasRun_once") == plan::ConditionDetermination::True);
}

TEST_CASE("Stuck handler can trigger a replan", "[agent_process][stuck]") {
    auto handler = std::make_shared<AddInputStuckHandler>();
    auto listener = std::make_shared<EventSavingListener>();
    auto agent_process = make_process(frog_agent()->with_stuck_handler(handler), listener);

    agent_process->run();

    REQUIRE(handler->calls == 1);
    REQUIRE(agent_process->status() == AgentProcessStatus::Completed);
    REQUIRE(agent_process->result_of_type<Frog>()->name() == "rescued");
    REQUIRE(listener->count(ProcessEventType::ProcessStuck) == 1);
    REQUIRE(listener->count(ProcessEventType::StuckHandlerResult) == 1);
}

TEST_CASE("Unresolved stuck process stays stuck", "[agent_process][stuck]") {
    auto handler = std::make_shared<MulticastStuckHandler>(std::vector<StuckHandlerPtr>{
        std::make_shared<GiveUpStuckHandler>("no input"),
        std::make_shared<GiveUpStuckHandler>("no idea")
    });
    auto listener = std::make_shared<EventSavingListener>();
    auto agent_process = make_process(frog_agent()->with_stuck_handler(handler), listener);

    agent_process->run();

    REQUIRE(agent_process->status() == AgentProcessStatus::Stuck);
    auto events = listener->process_events();
    REQUIRE(events.back().type == ProcessEventType::StuckHandlerResult);
    REQUIRE(events.back().message == "no input; no idea");
}

TEST_CASE("Multicast stuck handler stops at the first replan", "[agent_process][stuck]") {
    auto rescuer = std::make_shared<AddInputStuckHandler>();
    MulticastStuckHandler handler({std::make_shared<GiveUpStuckHandler>("no input"), rescuer, rescuer});
    auto agent_process = make_process(frog_agent(), std::make_shared<EventSavingListener>());

    auto result = handler.handle_stuck(*agent_process);

    REQUIRE(result.code == StuckHandlingResultCode::Replan);
    REQUIRE(rescuer->calls == 1);
    REQUIRE(result.to_json()["code"] == "REPLAN");
}

TEST_CASE("Goal change can be forbidden", "[agent_process][goal]") {
    auto options = test_options();
    options.allow_goal_change = false;
    auto listener = std::make_shared<EventSavingListener>();
    auto agent_process = make_process(goal_switching_agent(), listener, options);

    try {
        agent_process->run();
        FAIL("Expected UsageError");
    } catch (const UsageError& e) {
        REQUIRE(e.error().code == ErrorCode::GoalChangeNotAllowed);
    }

    REQUIRE(agent_process->status() == AgentProcessStatus::Failed);
    REQUIRE(agent_process->failure_info()->error->code == ErrorCode::GoalChangeNotAllowed);
    REQUIRE(listener->count(ProcessEventType::ProcessFailed) == 1);
}

TEST_CASE("Goal change is allowed by default", "[agent_process][goal]") {
    auto agent_process = make_process(goal_switching_agent(), std::make_shared<EventSavingListener>());

    agent_process->run();

    REQUIRE(agent_process->status() == AgentProcessStatus::Completed);
    REQUIRE(agent_process->goal()->name() == "G2");
}

TEST_CASE("Failing action exhausts its retries", "[agent_process][qos]") {
    auto attempts = std::make_shared<std::atomic<int>>(0);
    auto definition = quick_action("flaky", {"UserInput"}, {"Person"}, [attempts](ProcessContext&) -> ActionResult {
        ++*attempts;
        throw std::runtime_error("boom");
    });
    definition.qos.max_attempts = 3;

    AgentDefinition agent_definition;
    agent_definition.name = "Flaky";
    agent_definition.actions = {Action::create(definition)};
    agent_definition.goals = {Goal::create_instance("Create a person", Person::kTypeName)};
    auto listener = std::make_shared<EventSavingListener>();
    auto agent_process = make_process(Agent::create(std::move(agent_definition)), listener);
    agent_process->add_object(std::make_shared<UserInput>("Rod"));

    agent_process->run();

    REQUIRE(attempts->load() == 3);
    REQUIRE(agent_process->status() == AgentProcessStatus::Failed);
    REQUIRE(agent_process->history_size() == 1);
    auto failure = agent_process->failure_info();
    REQUIRE(failure);
    REQUIRE(failure->error->code == ErrorCode::ActionRetriesExhausted);
    REQUIRE(failure->error->message == "Gave up after 3 attempts: boom");
    REQUIRE(listener->count(ProcessEventType::ProcessFailed) == 1);
}

TEST_CASE("Action succeeds on a later attempt", "[agent_process][qos]") {
    auto attempts = std::make_shared<std::atomic<int>>(0);
    auto definition = quick_action("eventually", {"UserInput"}, {"Person"}, [attempts](ProcessContext&) {
        if (++*attempts < 3) {
            return ActionResult::failed(ErrorCode::TransientActionFailure, "not yet");
        }
        return ActionResult::completed(std::make_shared<Person>("Rod"));
    });
    definition.qos.max_attempts = 5;

    AgentDefinition agent_definition;
    agent_definition.name = "Patient";
    agent_definition.actions = {Action::create(definition)};
    agent_definition.goals = {Goal::create_instance("Create a person", Person::kTypeName)};
    auto agent_process = make_process(Agent::create(std::move(agent_definition)),
                                      std::make_shared<EventSavingListener>());
    agent_process->add_object(std::make_shared<UserInput>("Rod"));

    agent_process->run();

    REQUIRE(attempts->load() == 3);
    REQUIRE(agent_process->status() == AgentProcessStatus::Completed);
}

TEST_CASE("Named output is bound by name", "[agent_process]") {
    AgentDefinition definition;
    definition.name = "Namer";
    definition.actions = {Action::create(quick_action("adopt", {"UserInput"}, {"pet:Frog"},
        [](ProcessContext&) {
            return ActionResult::completed(std::make_shared<Frog>("Kermit"));
        }))};
    definition.goals = {Goal::create("Adopt", "Adopt a pet", {}, {IoBinding("pet:Frog")})};
    auto agent_process = make_process(Agent::create(std::move(definition)),
                                      std::make_shared<EventSavingListener>());
    agent_process->add_object(std::make_shared<UserInput>("frog please"));

    agent_process->run();

    REQUIRE(agent_process->status() == AgentProcessStatus::Completed);
    REQUIRE(agent_process->blackboard().get("pet") != nullptr);
}

TEST_CASE("Agent without goals cannot run", "[agent_process]") {
    AgentDefinition definition;
    definition.name = "Aimless";
    definition.actions = {user_input_to_person()};
    auto agent_process = make_process(Agent::create(std::move(definition)),
                                      std::make_shared<EventSavingListener>());

    try {
        agent_process->run();
        FAIL("Expected UsageError");
    } catch (const UsageError& e) {
        REQUIRE(e.error().code == ErrorCode::AgentHasNoGoals);
    }
    REQUIRE(agent_process->status() == AgentProcessStatus::NotStarted);
}

TEST_CASE("Killed process does not run", "[agent_process]") {
    auto listener = std::make_shared<EventSavingListener>();
    auto agent_process = make_process(frog_agent(), listener);
    agent_process->add_object(std::make_shared<UserInput>("Kermit"));

    auto killed = agent_process->kill();
    REQUIRE(killed);
    REQUIRE(killed->type == ProcessEventType::ProcessKilled);
    REQUIRE(agent_process->status() == AgentProcessStatus::Killed);
    REQUIRE_FALSE(agent_process->kill());

    agent_process->run();
    REQUIRE(agent_process->status() == AgentProcessStatus::Killed);
    REQUIRE(agent_process->history_size() == 0);
    REQUIRE(listener->count(ProcessEventType::ProcessKilled) == 1);
}

TEST_CASE("Scheduled action pauses the process", "[agent_process]") {
    auto listener = std::make_shared<EventSavingListener>();
    platform::PlatformServices services;
    services.event_listener = listener;
    services.operation_scheduler = std::make_shared<LaterOperationScheduler>();
    auto agent_process = std::make_shared<AgentProcess>("paused", std::nullopt, frog_agent(),
                                                        test_options(), nullptr, services);
    agent_process->add_object(std::make_shared<UserInput>("Kermit"));

    agent_process->run();

    REQUIRE(agent_process->status() == AgentProcessStatus::Paused);
    REQUIRE(agent_process->history_size() == 0);
    REQUIRE(listener->count(ProcessEventType::ProcessPaused) == 1);
}

TEST_CASE("Pronto scheduler applies delays", "[agent_process]") {
    ProntoOperationScheduler scheduler;
    auto definition = quick_action("search", {}, {}, nullptr);
    definition.tool_groups = {"web"};
    auto with_tools = Action::create(definition);
    auto plain = user_input_to_person();

    ProcessOptions options;
    REQUIRE(scheduler.schedule_action(*with_tools, options).kind == OperationSchedule::Kind::Pronto);

    options.control.operation_delay = Duration(5);
    options.control.tool_delay = Duration(20);
    auto delayed = scheduler.schedule_action(*with_tools, options);
    REQUIRE(delayed.kind == OperationSchedule::Kind::Delayed);
    REQUIRE(delayed.delay == Duration(25));
    REQUIRE(scheduler.schedule_action(*plain, options).delay == Duration(5));
}

TEST_CASE("Process uses the blackboard from its options", "[agent_process]") {
    auto shared = std::make_shared<blackboard::InMemoryBlackboard>("shared");
    shared->add_object(std::make_shared<UserInput>("Kermit"));
    auto options = test_options();
    options.blackboard = shared;

    auto agent_process = make_process(frog_agent(), std::make_shared<EventSavingListener>(), options);
    agent_process->run();

    REQUIRE(agent_process->blackboard().id() == "shared");
    REQUIRE(shared->count<Frog>() == 1);
}

TEST_CASE("LLM usage is recorded on the process", "[agent_process][llm]") {
    auto llm = std::make_shared<FakeLlmOperations>("Hello there", 400, 0.6);
    auto tools = std::make_shared<platform::RegistryToolGroupResolver>();
    REQUIRE(tools->register_group(platform::ToolGroup{"web", "Web tools", {"search"}}).is_ok());
    REQUIRE(tools->register_group(platform::ToolGroup{"web", "Again", {}}).error().code == ErrorCode::AlreadyExists);

    auto listener = std::make_shared<EventSavingListener>();
    platform::PlatformServices services;
    services.event_listener = listener;
    services.llm_operations = llm;
    services.tool_group_resolver = tools;
    auto agent_process = std::make_shared<AgentProcess>("llm", std::nullopt, frog_agent(),
                                                        test_options(), nullptr, services);

    auto text = agent_process->context().generate_text("Say hello", {"web"});
    REQUIRE(text.is_ok());
    REQUIRE(text.value() == "Hello there");
    REQUIRE(llm->last_request().tool_groups.size() == 1);
    REQUIRE(llm->last_request().interaction_id.rfind("llm/", 0) == 0);
    REQUIRE(agent_process->total_tokens() == 400);
    REQUIRE(agent_process->cost() == 0.6);
    REQUIRE(listener->count(ProcessEventType::UsageRecorded) == 1);

    auto unknown = agent_process->context().generate_text("Say hello", {"math"});
    REQUIRE(unknown.is_err());
    REQUIRE(unknown.error().code == ErrorCode::NotFound);
    REQUIRE(llm->calls() == 1);
}

TEST_CASE("Text generation needs an LLM", "[agent_process][llm]") {
    auto agent_process = make_process(frog_agent(), std::make_shared<EventSavingListener>());

    auto text = agent_process->context().generate_text("Say hello");

    REQUIRE(text.is_err());
    REQUIRE(text.error().code == ErrorCode::NotImplemented);
}

TEST_CASE("Cost budget stops LLM heavy processes", "[agent_process][llm][budget]") {
    auto definition = quick_action("chat", {}, {}, [](ProcessContext& context) {
        auto reply = context.generate_text("Are we done yet?");
        if (reply.is_err()) {
            return ActionResult::failed(reply.error());
        }
        return ActionResult::completed();
    });
    definition.post = {"done"};
    definition.can_rerun = true;

    AgentDefinition agent_definition;
    agent_definition.name = "Chatty";
    agent_definition.actions = {Action::create(definition)};
    agent_definition.goals = {Goal::create("Finish", "Get it done", {"done"})};

    platform::PlatformServices services;
    services.llm_operations = std::make_shared<FakeLlmOperations>("Not yet", 400, 0.6);
    auto options = test_options();
    options.budget.cost = 1.0;
    auto agent_process = std::make_shared<AgentProcess>("chatty", std::nullopt,
                                                        Agent::create(std::move(agent_definition)),
                                                        options, nullptr, services);

    agent_process->run();

    REQUIRE(agent_process->status() == AgentProcessStatus::Terminated);
    REQUIRE(agent_process->history_size() == 2);
    REQUIRE(agent_process->total_tokens() == 800);
    REQUIRE(agent_process->failure_info()->reason.rfind("Budget exceeded", 0) == 0);
}

TEST_CASE("Process serializes its state", "[agent_process]") {
    auto agent_process = make_process(frog_agent(), std::make_shared<EventSavingListener>());
    agent_process->add_object(std::make_shared<UserInput>("Kermit"));
    agent_process->run();

    auto json = agent_process->to_json();

    REQUIRE(json["id"] == "test-process");
    REQUIRE(json["status"] == "COMPLETED");
    REQUIRE(json["goal"] == "Create Frog");
    REQUIRE(json["history"].size() == 2);
    REQUIRE(agent_process->info_string().find("status=COMPLETED") != std::string::npos);
}
