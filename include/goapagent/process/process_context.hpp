#pragma once

#include "process_options.hpp"
#include "goapagent/blackboard/blackboard.hpp"
#include "goapagent/event/events.hpp"
#include "goapagent/platform/platform_services.hpp"

#include <string>
#include <vector>

namespace goapagent::process {

class AgentProcess;

// What an action body or condition sees of its process
class ProcessContext {
public:
    ProcessContext(AgentProcess& process, platform::PlatformServices& services)
        : process_(process), services_(services) {}

    AgentProcess& agent_process() { return process_; }
    const AgentProcess& agent_process() const { return process_; }

    blackboard::Blackboard& blackboard();
    const ProcessOptions& process_options() const;
    platform::PlatformServices& platform_services() { return services_; }

    // Emit an event on behalf of the process
    void on_process_event(event::ProcessEventType type, std::string message, Json metadata = Json::object());

    // Generate text with the platform LLM, granting the named tool groups.
    // Token usage and cost are recorded on the process.
    Result<std::string, Error> generate_text(const std::string& prompt,
                                             const std::vector<std::string>& tool_groups = {});

private:
    AgentProcess& process_;
    platform::PlatformServices& services_;
};

}  // namespace goapagent::process
