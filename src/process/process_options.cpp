#include "goapagent/process/process_options.hpp"

namespace goapagent::process {

EarlyTerminationPolicyPtr Budget::early_termination_policy() const {
    return EarlyTerminationPolicy::first_of({
        EarlyTerminationPolicy::max_actions(actions),
        EarlyTerminationPolicy::max_tokens(tokens),
        EarlyTerminationPolicy::hard_budget_limit(cost)
    });
}

ProcessOptions ProcessOptions::from_config(const Config& config) {
    ProcessOptions options;
    options.test = config.process.test;
    options.allow_goal_change = config.process.allow_goal_change;
    options.verbosity.show_prompts = config.process.show_prompts;
    options.verbosity.show_llm_responses = config.process.show_llm_responses;
    options.verbosity.debug = config.process.debug;
    options.budget = Budget::from_config(config.budget);
    options.control.tool_delay = Duration(config.process.tool_delay_ms);
    options.control.operation_delay = Duration(config.process.operation_delay_ms);
    return options;
}

EarlyTerminationPolicyPtr ProcessOptions::termination_policy() const {
    if (control.early_termination_policy) {
        return control.early_termination_policy;
    }
    return budget.early_termination_policy();
}

Json ProcessOptions::to_json() const {
    return Json{
        {"context_id", context_id ? Json(*context_id) : Json()},
        {"test", test},
        {"allow_goal_change", allow_goal_change},
        {"budget", budget.to_json()},
        {"tool_delay_ms", control.tool_delay.count()},
        {"operation_delay_ms", control.operation_delay.count()},
        {"verbosity", {
            {"show_prompts", verbosity.show_prompts},
            {"show_llm_responses", verbosity.show_llm_responses},
            {"debug", verbosity.debug},
            {"show_planning", verbosity.show_planning}
        }}
    };
}

}  // namespace goapagent::process
