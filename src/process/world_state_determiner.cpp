#include "goapagent/process/world_state_determiner.hpp"
#include "goapagent/model/action.hpp"
#include "goapagent/model/io_binding.hpp"
#include "goapagent/process/agent_process.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace goapagent::process {

using plan::ConditionDetermination;

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

BlackboardWorldStateDeterminer::BlackboardWorldStateDeterminer(ProcessContext& context)
    : context_(context)
    , known_conditions_(context.agent_process().agent()->planning_system().known_conditions())
{
}

plan::GoapWorldState BlackboardWorldStateDeterminer::determine_world_state() {
    plan::EffectSpec state;
    for (const auto& condition : known_conditions_) {
        state[condition] = determine_condition(condition);
    }
    return plan::GoapWorldState(std::move(state));
}

ConditionDetermination BlackboardWorldStateDeterminer::determine_condition(const std::string& condition) {
    auto& process = context_.agent_process();
    ConditionDetermination determination;

    if (condition.find(':') != std::string::npos) {
        model::IoBinding binding(condition);
        auto value = context_.blackboard().get_value(binding.name(), binding.type(),
                                                     &process.agent()->aggregation_registry());
        determination = plan::determination_from_bool(value != nullptr);
        spdlog::debug("Determined binding condition {}={}", condition, plan::to_string(determination));
    } else if (condition.rfind(model::kHasRunPrefix, 0) == 0) {
        auto action_name = condition.substr(model::kHasRunPrefix.size());
        auto history = process.history();
        bool has_run = std::any_of(history.begin(), history.end(), [&](const ActionInvocation& invocation) {
            return invocation.action_name == action_name;
        });
        determination = plan::determination_from_bool(has_run);
        spdlog::debug("Determined hasRun condition {}={}", condition, plan::to_string(determination));
    } else if (auto agent_condition = resolve_agent_condition(condition)) {
        determination = agent_condition->evaluate(context_);
        spdlog::debug("Determined agent condition {}={}", condition, plan::to_string(determination));
    } else {
        // Explicit flag; unset means FALSE rather than UNKNOWN
        determination = plan::as_true_or_false(
            plan::determination_from_optional(context_.blackboard().get_condition(condition)));
        spdlog::debug("Determined explicit condition {}={}", condition, plan::to_string(determination));
    }

    if (determination == ConditionDetermination::Unknown) {
        spdlog::warn("Determined condition {} to be unknown in process {}", condition, process.id());
    }
    return determination;
}

model::ConditionPtr BlackboardWorldStateDeterminer::resolve_agent_condition(const std::string& condition) const {
    if (known_conditions_.count(condition) == 0) {
        return nullptr;
    }
    for (const auto& candidate : context_.agent_process().agent()->condition_list()) {
        if (candidate->name() == condition || ends_with(candidate->name(), "." + condition)) {
            return candidate;
        }
    }
    return nullptr;
}

}  // namespace goapagent::process
