#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace goapagent::core {

// JSON alias
using Json = nlohmann::json;

// Time types
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

// Common type aliases
using ProcessId = std::string;
using BlackboardId = std::string;
using AgentName = std::string;

// Value in [0, 1] used for action and goal cost and value.
// Not enforced: plans also accept values outside the range.
using ZeroToOne = double;

// Default binding name for anonymous objects
inline constexpr std::string_view kDefaultBinding = "it";

inline int64_t to_epoch_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

// Add `indent` levels of two spaces to the front of text
inline std::string indent(const std::string& text, int levels) {
    return std::string(static_cast<size_t>(levels) * 2, ' ') + text;
}

}  // namespace goapagent::core
