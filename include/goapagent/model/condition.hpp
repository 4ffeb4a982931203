#pragma once

#include "goapagent/core/types.hpp"
#include "goapagent/plan/condition_determination.hpp"

#include <functional>
#include <memory>
#include <string>

namespace goapagent::process {
class ProcessContext;
}

namespace goapagent::model {

using namespace goapagent::core;
using plan::ConditionDetermination;

// Named predicate over the running process. Stateless: evaluated fresh every tick.
class Condition {
public:
    virtual ~Condition() = default;

    virtual const std::string& name() const = 0;

    // 0 is cheap, 1 is expensive
    virtual ZeroToOne cost() const = 0;

    virtual ConditionDetermination evaluate(process::ProcessContext& context) const = 0;

    std::string info_string() const;
};

using ConditionPtr = std::shared_ptr<const Condition>;

// Condition backed by a boolean function
class ComputedBooleanCondition : public Condition {
public:
    using Evaluator = std::function<bool(process::ProcessContext&, const Condition&)>;

    ComputedBooleanCondition(std::string name, ZeroToOne cost, Evaluator evaluator)
        : name_(std::move(name)), cost_(cost), evaluator_(std::move(evaluator)) {}

    static ConditionPtr create(std::string name, Evaluator evaluator, ZeroToOne cost = 0.0) {
        return std::make_shared<ComputedBooleanCondition>(std::move(name), cost, std::move(evaluator));
    }

    const std::string& name() const override { return name_; }
    ZeroToOne cost() const override { return cost_; }

    ConditionDetermination evaluate(process::ProcessContext& context) const override {
        return plan::determination_from_bool(evaluator_(context, *this));
    }

private:
    std::string name_;
    ZeroToOne cost_;
    Evaluator evaluator_;
};

// TRUE and FALSE swap, UNKNOWN stays. Named "!a".
ConditionPtr not_condition(ConditionPtr condition);

// TRUE only when the operand is UNKNOWN. Named "?a".
ConditionPtr unknown_condition(ConditionPtr condition);

// Any FALSE wins, then UNKNOWN, else TRUE. The cheaper operand runs first.
ConditionPtr and_conditions(ConditionPtr a, ConditionPtr b);

// Any TRUE wins, then UNKNOWN, else FALSE. The cheaper operand runs first.
ConditionPtr or_conditions(ConditionPtr a, ConditionPtr b);

}  // namespace goapagent::model
