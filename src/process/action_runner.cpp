#include "goapagent/process/action_runner.hpp"
#include "goapagent/process/agent_process.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace goapagent::process {

using model::ActionResult;
using model::ActionStatus;
using model::ActionStatusCode;

namespace {

ActionResult attempt_body(ProcessContext& context,
                          const model::Action& action,
                          const model::ActionBody& body,
                          int attempt) {
    if (!body) {
        return ActionResult::failed(Error{ErrorCode::NotImplemented, "Action has no body", action.name()});
    }
    try {
        return body(context);
    } catch (const UsageError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::warn("Action {} attempt {} threw: {}", action.name(), attempt, e.what());
        auto error = Error::from_exception(e);
        error.context = action.name();
        return ActionResult::failed(std::move(error));
    }
}

void bind_output(ProcessContext& context, const model::Action& action, const model::DomainObjectPtr& value) {
    if (!value) {
        return;
    }
    auto& process = context.agent_process();
    const auto& outputs = action.outputs();
    if (outputs.size() == 1 && !outputs.front().is_default()) {
        process.bind(outputs.front().name(), value);
    } else {
        process.add_object(value);
    }
}

}  // namespace

ActionStatus ActionRunner::execute(ProcessContext& context,
                                   const model::Action& action,
                                   const model::ActionBody& body) {
    auto start = std::chrono::steady_clock::now();

    auto retry = action.qos().retry_template();
    auto result = retry.execute([&](int attempt) {
        auto outcome = attempt_body(context, action, body, attempt);
        if (outcome.is_failure()) {
            spdlog::debug("Action {} attempt {}/{} failed: {}", action.name(), attempt,
                          retry.max_attempts(), outcome.error().full_message());
        }
        return outcome;
    });

    ActionStatus status;
    if (result.is_completed()) {
        bind_output(context, action, result.value());
        status.status = ActionStatusCode::Succeeded;
    } else if (result.is_waiting()) {
        context.agent_process().add_object(result.awaitable());
        status.status = ActionStatusCode::Waiting;
    } else {
        auto error = result.error();
        spdlog::error("Action {} failed after {} attempt(s): {}", action.name(),
                      retry.max_attempts(), error.full_message());
        if (retry.max_attempts() > 1) {
            error = Error{ErrorCode::ActionRetriesExhausted,
                          "Gave up after " + std::to_string(retry.max_attempts()) + " attempts: " + error.message,
                          action.name()};
        }
        status.status = ActionStatusCode::Failed;
        status.error = std::move(error);
    }

    status.running_time = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
    return status;
}

}  // namespace goapagent::process
