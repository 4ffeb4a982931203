#pragma once

#include "world_state.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace goapagent::plan {

// Anything with preconditions that the planner can reason about
class GoapStep {
public:
    virtual ~GoapStep() = default;

    virtual const std::string& name() const = 0;
    virtual const EffectSpec& preconditions() const = 0;
    virtual ZeroToOne value() const = 0;

    // Names of every condition this step refers to
    virtual std::set<std::string> known_conditions() const;

    bool is_achievable(const GoapWorldState& state) const {
        return state.satisfies(preconditions());
    }
};

class GoapAction : public GoapStep {
public:
    // Expected effects. The world state must be re-checked after execution.
    virtual const EffectSpec& effects() const = 0;
    virtual ZeroToOne cost() const = 0;

    std::set<std::string> known_conditions() const override;

    std::string info_string() const;
};

class GoapGoal : public GoapStep {
public:
    std::string info_string() const;
};

// Plain action for planning without an agent
class SimpleGoapAction : public GoapAction {
public:
    SimpleGoapAction(std::string name, EffectSpec preconditions, EffectSpec effects,
                     ZeroToOne cost = 0.0, ZeroToOne value = 0.0);

    // Every name in `pre` required TRUE, every name in `post` produced TRUE
    static std::shared_ptr<SimpleGoapAction> create(
        std::string name,
        const std::vector<std::string>& pre,
        const std::vector<std::string>& post,
        ZeroToOne cost = 0.0,
        ZeroToOne value = 0.0);

    const std::string& name() const override { return name_; }
    const EffectSpec& preconditions() const override { return preconditions_; }
    const EffectSpec& effects() const override { return effects_; }
    ZeroToOne cost() const override { return cost_; }
    ZeroToOne value() const override { return value_; }

private:
    std::string name_;
    EffectSpec preconditions_;
    EffectSpec effects_;
    ZeroToOne cost_;
    ZeroToOne value_;
};

class SimpleGoapGoal : public GoapGoal {
public:
    SimpleGoapGoal(std::string name, EffectSpec preconditions, ZeroToOne value = 0.0);

    static std::shared_ptr<SimpleGoapGoal> create(
        std::string name,
        const std::vector<std::string>& pre,
        ZeroToOne value = 0.0);

    const std::string& name() const override { return name_; }
    const EffectSpec& preconditions() const override { return preconditions_; }
    ZeroToOne value() const override { return value_; }

private:
    std::string name_;
    EffectSpec preconditions_;
    ZeroToOne value_;
};

using GoapActionPtr = std::shared_ptr<const GoapAction>;
using GoapGoalPtr = std::shared_ptr<const GoapGoal>;

// Actions and goals the planner searches over
struct GoapPlanningSystem {
    std::vector<GoapActionPtr> actions;
    std::vector<GoapGoalPtr> goals;

    std::set<std::string> known_preconditions() const;
    std::set<std::string> known_effects() const;
    std::set<std::string> known_conditions() const;

    std::string info_string() const;
};

}  // namespace goapagent::plan
