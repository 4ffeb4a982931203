#include "goapagent/process/stuck_handler.hpp"

namespace goapagent::process {

StuckHandlerResult MulticastStuckHandler::handle_stuck(AgentProcess& process) {
    std::string messages;
    for (const auto& handler : handlers_) {
        auto result = handler->handle_stuck(process);
        if (result.code == StuckHandlingResultCode::Replan) {
            return result;
        }
        if (!messages.empty()) {
            messages += "; ";
        }
        messages += result.message;
    }
    return StuckHandlerResult{
        messages.empty() ? std::string("No stuck handler could resolve the process") : messages,
        StuckHandlingResultCode::NoResolution
    };
}

}  // namespace goapagent::process
