#pragma once

#include <optional>
#include <string_view>

namespace goapagent::plan {

// Tri-state truth value of a named condition
enum class ConditionDetermination {
    True,
    False,
    Unknown
};

inline std::string_view to_string(ConditionDetermination determination) {
    switch (determination) {
        case ConditionDetermination::True: return "TRUE";
        case ConditionDetermination::False: return "FALSE";
        case ConditionDetermination::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

inline ConditionDetermination determination_from_bool(bool value) {
    return value ? ConditionDetermination::True : ConditionDetermination::False;
}

inline ConditionDetermination determination_from_optional(std::optional<bool> value) {
    if (!value) {
        return ConditionDetermination::Unknown;
    }
    return determination_from_bool(*value);
}

// Treat UNKNOWN as FALSE
inline ConditionDetermination as_true_or_false(ConditionDetermination determination) {
    return determination == ConditionDetermination::True
        ? ConditionDetermination::True
        : ConditionDetermination::False;
}

}  // namespace goapagent::plan
