#include "goapagent/model/action.hpp"
#include "goapagent/process/action_runner.hpp"

#include <algorithm>

namespace goapagent::model {

namespace {

std::vector<std::string> binding_values(const std::vector<IoBinding>& bindings) {
    std::vector<std::string> values;
    values.reserve(bindings.size());
    for (const auto& binding : bindings) {
        values.push_back(binding.value());
    }
    return values;
}

}  // namespace

Json ActionMetadata::to_json() const {
    return Json{
        {"name", name},
        {"description", description},
        {"inputs", inputs},
        {"outputs", outputs},
        {"pre", pre},
        {"post", post},
        {"cost", cost},
        {"value", value},
        {"can_rerun", can_rerun},
        {"tool_groups", tool_groups},
        {"qos", qos.to_json()}
    };
}

Action::Action(ActionDefinition definition)
    : definition_(std::move(definition))
{
    using plan::ConditionDetermination;

    for (const auto& condition : definition_.pre) {
        preconditions_[condition] = ConditionDetermination::True;
    }
    for (const auto& input : definition_.inputs) {
        preconditions_[input.value()] = ConditionDetermination::True;
    }
    if (!definition_.can_rerun) {
        // Don't produce what already exists unless we also consume it
        for (const auto& output : definition_.outputs) {
            auto consumed = std::find(definition_.inputs.begin(), definition_.inputs.end(), output);
            if (consumed == definition_.inputs.end()) {
                preconditions_[output.value()] = ConditionDetermination::False;
            }
        }
        preconditions_[has_run_condition(definition_.name)] = ConditionDetermination::False;
    }

    for (const auto& condition : definition_.post) {
        effects_[condition] = ConditionDetermination::True;
    }
    for (const auto& output : definition_.outputs) {
        effects_[output.value()] = ConditionDetermination::True;
    }
    effects_[has_run_condition(definition_.name)] = ConditionDetermination::True;
}

ActionStatus Action::execute(process::ProcessContext& context) const {
    return process::ActionRunner::execute(context, *this, definition_.body);
}

std::vector<PropertyDefinition> Action::referenced_input_properties(const std::string& variable) const {
    auto it = definition_.input_properties.find(variable);
    if (it == definition_.input_properties.end()) {
        return {};
    }
    return it->second;
}

ActionMetadata Action::metadata() const {
    ActionMetadata metadata;
    metadata.name = definition_.name;
    metadata.description = definition_.description;
    metadata.inputs = binding_values(definition_.inputs);
    metadata.outputs = binding_values(definition_.outputs);
    metadata.pre = definition_.pre;
    metadata.post = definition_.post;
    metadata.cost = definition_.cost;
    metadata.value = definition_.value;
    metadata.can_rerun = definition_.can_rerun;
    metadata.tool_groups = definition_.tool_groups;
    metadata.qos = definition_.qos;
    return metadata;
}

}  // namespace goapagent::model
