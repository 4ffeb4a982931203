#include "goapagent/process/process_context.hpp"
#include "goapagent/core/uuid.hpp"
#include "goapagent/process/agent_process.hpp"

#include <spdlog/spdlog.h>

namespace goapagent::process {

blackboard::Blackboard& ProcessContext::blackboard() {
    return process_.blackboard();
}

const ProcessOptions& ProcessContext::process_options() const {
    return process_.options();
}

void ProcessContext::on_process_event(event::ProcessEventType type, std::string message, Json metadata) {
    process_.emit(type, std::move(message), std::move(metadata));
}

Result<std::string, Error> ProcessContext::generate_text(const std::string& prompt,
                                                         const std::vector<std::string>& tool_groups) {
    if (!services_.llm_operations) {
        return Result<std::string, Error>::err(ErrorCode::NotImplemented,
                                               "No LLM operations configured", process_.id());
    }

    platform::LlmRequest request;
    request.prompt = prompt;
    request.interaction_id = process_.id() + "/" + UUID::generate().to_string();
    for (const auto& role : tool_groups) {
        auto group = services_.tool_group_resolver->resolve(role);
        if (!group) {
            return Result<std::string, Error>::err(ErrorCode::NotFound, "Unknown tool group", role);
        }
        request.tool_groups.push_back(std::move(*group));
    }

    const auto& verbosity = process_.options().verbosity;
    if (verbosity.show_prompts) {
        spdlog::info("[{}] Prompt: {}", process_.id(), prompt);
    }

    auto response = services_.llm_operations->generate(request);
    if (response.is_err()) {
        spdlog::warn("[{}] LLM call failed: {}", process_.id(), response.error().to_string());
        return Result<std::string, Error>::err(response.error());
    }

    process_.record_usage(response->total_tokens(), response->cost);
    if (verbosity.show_llm_responses) {
        spdlog::info("[{}] LLM response: {}", process_.id(), response->text);
    }
    return Result<std::string, Error>::ok(response->text);
}

}  // namespace goapagent::process
