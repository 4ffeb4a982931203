#pragma once

#include "io_binding.hpp"
#include "goapagent/plan/goap.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace goapagent::model {

// How a goal may be offered to outside callers
struct GoalExport {
    bool remote = false;
    std::vector<std::string> start_input_types;
};

// Desired end condition of an agent process
class Goal : public plan::GoapGoal {
public:
    // A goal with an output type is reached once an instance of it exists
    Goal(std::string name,
         std::string description,
         std::vector<std::string> pre = {},
         std::vector<IoBinding> inputs = {},
         std::optional<std::string> output_type = std::nullopt,
         ZeroToOne value = 0.0,
         GoalExport export_metadata = {});

    static std::shared_ptr<const Goal> create(
        std::string name,
        std::string description,
        std::vector<std::string> pre = {},
        std::vector<IoBinding> inputs = {},
        std::optional<std::string> output_type = std::nullopt,
        ZeroToOne value = 0.0)
    {
        return std::make_shared<const Goal>(std::move(name), std::move(description), std::move(pre),
                                            std::move(inputs), std::move(output_type), value);
    }

    // "Create <type>", satisfied by an instance of `type`
    static std::shared_ptr<const Goal> create_instance(const std::string& description,
                                                       const std::string& type);

    const std::string& name() const override { return name_; }
    const plan::EffectSpec& preconditions() const override { return preconditions_; }
    ZeroToOne value() const override { return value_; }

    const std::string& description() const { return description_; }
    const std::vector<std::string>& pre() const { return pre_; }
    const std::vector<IoBinding>& inputs() const { return inputs_; }
    const std::optional<std::string>& output_type() const { return output_type_; }
    const GoalExport& export_metadata() const { return export_; }

    std::shared_ptr<const Goal> with_precondition(const std::string& condition) const;
    std::shared_ptr<const Goal> with_value(ZeroToOne value) const;

    Json to_json() const;

private:
    std::string name_;
    std::string description_;
    std::vector<std::string> pre_;
    std::vector<IoBinding> inputs_;
    std::optional<std::string> output_type_;
    ZeroToOne value_;
    GoalExport export_;
    plan::EffectSpec preconditions_;
};

using GoalPtr = std::shared_ptr<const Goal>;

}  // namespace goapagent::model
