#include "goapagent/plan/goap.hpp"

#include <sstream>

namespace goapagent::plan {

namespace {

EffectSpec all_true(const std::vector<std::string>& names) {
    EffectSpec spec;
    for (const auto& name : names) {
        spec[name] = ConditionDetermination::True;
    }
    return spec;
}

}  // namespace

std::set<std::string> GoapStep::known_conditions() const {
    std::set<std::string> names;
    for (const auto& [key, _] : preconditions()) {
        names.insert(key);
    }
    return names;
}

std::set<std::string> GoapAction::known_conditions() const {
    auto names = GoapStep::known_conditions();
    for (const auto& [key, _] : effects()) {
        names.insert(key);
    }
    return names;
}

std::string GoapAction::info_string() const {
    std::ostringstream ss;
    ss << name() << " - pre=" << GoapWorldState(preconditions()).info_string()
       << " cost=" << cost() << " value=" << value();
    return ss.str();
}

std::string GoapGoal::info_string() const {
    std::ostringstream ss;
    ss << name() << " - pre=" << GoapWorldState(preconditions()).info_string()
       << " value=" << value();
    return ss.str();
}

SimpleGoapAction::SimpleGoapAction(std::string name, EffectSpec preconditions, EffectSpec effects,
                                   ZeroToOne cost, ZeroToOne value)
    : name_(std::move(name))
    , preconditions_(std::move(preconditions))
    , effects_(std::move(effects))
    , cost_(cost)
    , value_(value)
{
}

std::shared_ptr<SimpleGoapAction> SimpleGoapAction::create(
    std::string name,
    const std::vector<std::string>& pre,
    const std::vector<std::string>& post,
    ZeroToOne cost,
    ZeroToOne value) {

    return std::make_shared<SimpleGoapAction>(
        std::move(name), all_true(pre), all_true(post), cost, value);
}

SimpleGoapGoal::SimpleGoapGoal(std::string name, EffectSpec preconditions, ZeroToOne value)
    : name_(std::move(name))
    , preconditions_(std::move(preconditions))
    , value_(value)
{
}

std::shared_ptr<SimpleGoapGoal> SimpleGoapGoal::create(
    std::string name,
    const std::vector<std::string>& pre,
    ZeroToOne value) {

    return std::make_shared<SimpleGoapGoal>(std::move(name), all_true(pre), value);
}

std::set<std::string> GoapPlanningSystem::known_preconditions() const {
    std::set<std::string> names;
    for (const auto& action : actions) {
        for (const auto& [key, _] : action->preconditions()) {
            names.insert(key);
        }
    }
    return names;
}

std::set<std::string> GoapPlanningSystem::known_effects() const {
    std::set<std::string> names;
    for (const auto& action : actions) {
        for (const auto& [key, _] : action->effects()) {
            names.insert(key);
        }
    }
    return names;
}

std::set<std::string> GoapPlanningSystem::known_conditions() const {
    auto names = known_preconditions();
    auto effects = known_effects();
    names.insert(effects.begin(), effects.end());
    for (const auto& goal : goals) {
        for (const auto& [key, _] : goal->preconditions()) {
            names.insert(key);
        }
    }
    return names;
}

std::string GoapPlanningSystem::info_string() const {
    std::ostringstream ss;
    ss << "GOAP system:\n  actions:\n";
    for (const auto& action : actions) {
        ss << indent(action->name(), 2) << "\n";
    }
    ss << "  goals:\n";
    for (const auto& goal : goals) {
        ss << indent(goal->name(), 2) << "\n";
    }
    ss << "  known conditions:\n";
    for (const auto& name : known_conditions()) {
        ss << indent(name, 2) << "\n";
    }
    return ss.str();
}

}  // namespace goapagent::plan
