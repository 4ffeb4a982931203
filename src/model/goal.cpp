#include "goapagent/model/goal.hpp"

#include <algorithm>

namespace goapagent::model {

Goal::Goal(std::string name,
           std::string description,
           std::vector<std::string> pre,
           std::vector<IoBinding> inputs,
           std::optional<std::string> output_type,
           ZeroToOne value,
           GoalExport export_metadata)
    : name_(std::move(name))
    , description_(std::move(description))
    , pre_(std::move(pre))
    , inputs_(std::move(inputs))
    , output_type_(std::move(output_type))
    , value_(value)
    , export_(std::move(export_metadata))
{
    if (output_type_) {
        IoBinding produced(std::string(kDefaultBinding), *output_type_);
        if (std::find(inputs_.begin(), inputs_.end(), produced) == inputs_.end()) {
            inputs_.push_back(produced);
        }
    }

    for (const auto& condition : pre_) {
        preconditions_[condition] = plan::ConditionDetermination::True;
    }
    for (const auto& input : inputs_) {
        preconditions_[input.value()] = plan::ConditionDetermination::True;
    }
}

std::shared_ptr<const Goal> Goal::create_instance(const std::string& description,
                                                  const std::string& type) {
    return std::make_shared<const Goal>("Create " + type, description,
                                        std::vector<std::string>{},
                                        std::vector<IoBinding>{},
                                        type);
}

std::shared_ptr<const Goal> Goal::with_precondition(const std::string& condition) const {
    auto pre = pre_;
    pre.push_back(condition);
    return std::make_shared<const Goal>(name_, description_, std::move(pre), inputs_,
                                        output_type_, value_, export_);
}

std::shared_ptr<const Goal> Goal::with_value(ZeroToOne value) const {
    return std::make_shared<const Goal>(name_, description_, pre_, inputs_,
                                        output_type_, value, export_);
}

Json Goal::to_json() const {
    Json inputs = Json::array();
    for (const auto& input : inputs_) {
        inputs.push_back(input.value());
    }
    return Json{
        {"name", name_},
        {"description", description_},
        {"pre", pre_},
        {"inputs", inputs},
        {"output_type", output_type_ ? Json(*output_type_) : Json()},
        {"value", value_},
        {"export", {
            {"remote", export_.remote},
            {"start_input_types", export_.start_input_types}
        }}
    };
}

}  // namespace goapagent::model
