#pragma once

#include "early_termination.hpp"
#include "goapagent/blackboard/blackboard.hpp"
#include "goapagent/core/config.hpp"

#include <optional>
#include <string>

namespace goapagent::process {

// Limits applied through the default early termination policy
struct Budget {
    double cost = 2.0;
    int actions = 50;
    int tokens = 1000000;

    static Budget from_config(const BudgetConfig& config) {
        return Budget{config.cost, config.actions, config.tokens};
    }

    // first_of(max_actions, max_tokens, hard_budget_limit)
    EarlyTerminationPolicyPtr early_termination_policy() const;

    Json to_json() const {
        return Json{{"cost", cost}, {"actions", actions}, {"tokens", tokens}};
    }
};

struct Verbosity {
    bool show_prompts = false;
    bool show_llm_responses = false;
    bool debug = false;
    bool show_planning = false;
};

// Pacing and an explicit policy that replaces the budget's
struct ProcessControl {
    Duration tool_delay{0};
    Duration operation_delay{0};
    EarlyTerminationPolicyPtr early_termination_policy;
};

struct ProcessOptions {
    std::optional<std::string> context_id;
    blackboard::BlackboardPtr blackboard;  // Null: the process gets a fresh one
    bool test = false;
    Verbosity verbosity;
    bool allow_goal_change = true;
    Budget budget;
    ProcessControl control;

    static ProcessOptions from_config(const Config& config);

    // The control policy if set, otherwise the budget's
    EarlyTerminationPolicyPtr termination_policy() const;

    Json to_json() const;
};

}  // namespace goapagent::process
