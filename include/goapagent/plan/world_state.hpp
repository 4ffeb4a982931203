#pragma once

#include "condition_determination.hpp"
#include "goapagent/core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace goapagent::plan {

using namespace goapagent::core;

// Condition name to required or produced determination
using EffectSpec = std::map<std::string, ConditionDetermination>;

// Snapshot of every known condition at one point in time.
// Conditions absent from the map never satisfy a precondition.
class GoapWorldState {
public:
    GoapWorldState() = default;
    explicit GoapWorldState(EffectSpec state) : state_(std::move(state)) {}

    const EffectSpec& state() const { return state_; }

    std::optional<ConditionDetermination> get(const std::string& condition) const;

    bool satisfies(const EffectSpec& preconditions) const;

    std::vector<std::string> unknown_conditions() const;

    // Copies with the condition set to TRUE and FALSE
    std::vector<GoapWorldState> variants(const std::string& unknown_condition) const;

    GoapWorldState with(const std::string& condition, ConditionDetermination determination) const;

    // Copy with every effect applied
    GoapWorldState apply(const EffectSpec& effects) const;

    bool operator==(const GoapWorldState& other) const { return state_ == other.state_; }
    bool operator!=(const GoapWorldState& other) const { return state_ != other.state_; }
    bool operator<(const GoapWorldState& other) const { return state_ < other.state_; }

    Json to_json() const;
    std::string info_string() const;

private:
    EffectSpec state_;
};

}  // namespace goapagent::plan
