#pragma once

#include "awaitable.hpp"
#include "domain_object.hpp"
#include "goapagent/core/errors.hpp"

#include <optional>
#include <string_view>
#include <variant>

namespace goapagent::model {

// What an action body hands back to the runner
class ActionResult {
public:
    struct Completed {
        DomainObjectPtr value;  // May be null for side-effect actions
    };

    struct Waiting {
        AwaitablePtr awaitable;
    };

    struct Failed {
        Error error;
    };

    static ActionResult completed(DomainObjectPtr value = nullptr) {
        return ActionResult(Completed{std::move(value)});
    }

    static ActionResult waiting(AwaitablePtr awaitable) {
        return ActionResult(Waiting{std::move(awaitable)});
    }

    static ActionResult failed(Error error) {
        return ActionResult(Failed{std::move(error)});
    }

    static ActionResult failed(ErrorCode code, std::string message) {
        return failed(Error{code, std::move(message)});
    }

    bool is_completed() const { return std::holds_alternative<Completed>(data_); }
    bool is_waiting() const { return std::holds_alternative<Waiting>(data_); }
    bool is_failure() const { return std::holds_alternative<Failed>(data_); }

    const DomainObjectPtr& value() const { return std::get<Completed>(data_).value; }
    const AwaitablePtr& awaitable() const { return std::get<Waiting>(data_).awaitable; }
    const Error& error() const { return std::get<Failed>(data_).error; }

private:
    using Data = std::variant<Completed, Waiting, Failed>;

    explicit ActionResult(Data data) : data_(std::move(data)) {}

    Data data_;
};

enum class ActionStatusCode {
    Succeeded,
    Failed,
    Waiting,
    Paused
};

inline std::string_view to_string(ActionStatusCode code) {
    switch (code) {
        case ActionStatusCode::Succeeded: return "SUCCEEDED";
        case ActionStatusCode::Failed: return "FAILED";
        case ActionStatusCode::Waiting: return "WAITING";
        case ActionStatusCode::Paused: return "PAUSED";
    }
    return "FAILED";
}

// Outcome of one action invocation including every retry
struct ActionStatus {
    Duration running_time{0};
    ActionStatusCode status = ActionStatusCode::Succeeded;
    std::optional<Error> error;

    Json to_json() const {
        Json json{
            {"status", std::string(to_string(status))},
            {"running_time_ms", running_time.count()}
        };
        if (error) {
            json["error"] = error->to_string();
        }
        return json;
    }
};

}  // namespace goapagent::model
