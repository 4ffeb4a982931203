#pragma once

#include "goapagent/core/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace goapagent::process {

using namespace goapagent::core;

class AgentProcess;

enum class StuckHandlingResultCode {
    Replan,        // Something changed; try planning again
    NoResolution
};

inline std::string_view to_string(StuckHandlingResultCode code) {
    return code == StuckHandlingResultCode::Replan ? "REPLAN" : "NO_RESOLUTION";
}

struct StuckHandlerResult {
    std::string message;
    StuckHandlingResultCode code = StuckHandlingResultCode::NoResolution;

    Json to_json() const {
        return Json{{"message", message}, {"code", std::string(to_string(code))}};
    }
};

// Gets a chance to unblock a process that could not find a plan
class StuckHandler {
public:
    virtual ~StuckHandler() = default;

    // May modify the process blackboard before asking for a replan
    virtual StuckHandlerResult handle_stuck(AgentProcess& process) = 0;
};

using StuckHandlerPtr = std::shared_ptr<StuckHandler>;

// Tries handlers in order; the first REPLAN wins
class MulticastStuckHandler : public StuckHandler {
public:
    explicit MulticastStuckHandler(std::vector<StuckHandlerPtr> handlers)
        : handlers_(std::move(handlers)) {}

    StuckHandlerResult handle_stuck(AgentProcess& process) override;

private:
    std::vector<StuckHandlerPtr> handlers_;
};

}  // namespace goapagent::process
