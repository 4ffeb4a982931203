#pragma once

#include "action_qos.hpp"
#include "action_result.hpp"
#include "io_binding.hpp"
#include "schema_type.hpp"
#include "goapagent/plan/goap.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace goapagent::process {
class ProcessContext;
}

namespace goapagent::model {

// Prefix of the condition recording that an action has run
inline constexpr std::string_view kHasRunPrefix = "hasRun_";

inline std::string has_run_condition(const std::string& action_name) {
    return std::string(kHasRunPrefix) + action_name;
}

using ActionBody = std::function<ActionResult(process::ProcessContext&)>;

// Everything needed to build an Action
struct ActionDefinition {
    std::string name;
    std::string description;
    std::vector<IoBinding> inputs;
    std::vector<IoBinding> outputs;
    std::vector<std::string> pre;   // Extra conditions required TRUE
    std::vector<std::string> post;  // Extra conditions made TRUE
    ZeroToOne cost = 0.0;
    ZeroToOne value = 0.0;
    bool can_rerun = false;
    ActionQos qos;
    std::vector<std::string> tool_groups;

    // Input variable name to the properties the body reads from it
    std::map<std::string, std::vector<PropertyDefinition>> input_properties;

    ActionBody body;
};

// Serializable description of an action
struct ActionMetadata {
    std::string name;
    std::string description;
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
    std::vector<std::string> pre;
    std::vector<std::string> post;
    ZeroToOne cost = 0.0;
    ZeroToOne value = 0.0;
    bool can_rerun = false;
    std::vector<std::string> tool_groups;
    ActionQos qos;

    Json to_json() const;
};

// Step an agent can take. Preconditions and effects are computed once.
class Action : public plan::GoapAction {
public:
    explicit Action(ActionDefinition definition);

    static std::shared_ptr<const Action> create(ActionDefinition definition) {
        return std::make_shared<const Action>(std::move(definition));
    }

    const std::string& name() const override { return definition_.name; }
    const plan::EffectSpec& preconditions() const override { return preconditions_; }
    const plan::EffectSpec& effects() const override { return effects_; }
    ZeroToOne cost() const override { return definition_.cost; }
    ZeroToOne value() const override { return definition_.value; }

    const std::string& description() const { return definition_.description; }
    const std::vector<IoBinding>& inputs() const { return definition_.inputs; }
    const std::vector<IoBinding>& outputs() const { return definition_.outputs; }
    bool can_rerun() const { return definition_.can_rerun; }
    const ActionQos& qos() const { return definition_.qos; }
    const std::vector<std::string>& tool_groups() const { return definition_.tool_groups; }

    // Run the body with retry. Binds the result onto the process blackboard.
    virtual ActionStatus execute(process::ProcessContext& context) const;

    // Properties of `variable` this action reads; used for schema inference
    std::vector<PropertyDefinition> referenced_input_properties(const std::string& variable) const;

    ActionMetadata metadata() const;
    Json to_json() const { return metadata().to_json(); }

private:
    ActionDefinition definition_;
    plan::EffectSpec preconditions_;
    plan::EffectSpec effects_;
};

using ActionPtr = std::shared_ptr<const Action>;

}  // namespace goapagent::model
