#include "goapagent/plan/world_state.hpp"

namespace goapagent::plan {

std::optional<ConditionDetermination> GoapWorldState::get(const std::string& condition) const {
    auto it = state_.find(condition);
    if (it == state_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool GoapWorldState::satisfies(const EffectSpec& preconditions) const {
    for (const auto& [key, value] : preconditions) {
        auto it = state_.find(key);
        if (it == state_.end() || it->second != value) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> GoapWorldState::unknown_conditions() const {
    std::vector<std::string> unknown;
    for (const auto& [key, value] : state_) {
        if (value == ConditionDetermination::Unknown) {
            unknown.push_back(key);
        }
    }
    return unknown;
}

std::vector<GoapWorldState> GoapWorldState::variants(const std::string& unknown_condition) const {
    return {
        with(unknown_condition, ConditionDetermination::True),
        with(unknown_condition, ConditionDetermination::False)
    };
}

GoapWorldState GoapWorldState::with(const std::string& condition,
                                    ConditionDetermination determination) const {
    EffectSpec next = state_;
    next[condition] = determination;
    return GoapWorldState(std::move(next));
}

GoapWorldState GoapWorldState::apply(const EffectSpec& effects) const {
    EffectSpec next = state_;
    for (const auto& [key, value] : effects) {
        next[key] = value;
    }
    return GoapWorldState(std::move(next));
}

Json GoapWorldState::to_json() const {
    Json j = Json::object();
    for (const auto& [key, value] : state_) {
        j[key] = std::string(to_string(value));
    }
    return j;
}

std::string GoapWorldState::info_string() const {
    std::string result = "{";
    bool first = true;
    for (const auto& [key, value] : state_) {
        if (!first) {
            result += ", ";
        }
        result += key + "=" + std::string(to_string(value));
        first = false;
    }
    return result + "}";
}

}  // namespace goapagent::plan
