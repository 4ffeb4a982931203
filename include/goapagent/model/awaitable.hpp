#pragma once

#include "domain_object.hpp"
#include "goapagent/blackboard/blackboard.hpp"

#include <memory>
#include <string>

namespace goapagent::model {

enum class ResponseImpact {
    Updated,   // The blackboard changed; planning may take a new route
    Unchanged
};

// Request for input from outside the process. An action that returns one
// puts its process into WAITING until the response arrives.
class Awaitable : public DomainObject {
public:
    static constexpr const char* kTypeName = "Awaitable";

    Awaitable();

    const std::string& id() const { return id_; }

    std::string type_name() const override { return kTypeName; }

    virtual std::string message() const = 0;

    // Apply the external response to the process blackboard
    virtual ResponseImpact on_response(bool accepted, blackboard::Blackboard& blackboard) const = 0;

    Json to_json() const override;

private:
    std::string id_;
};

using AwaitablePtr = std::shared_ptr<const Awaitable>;

// Asks whether `payload` should be accepted; adds it to the blackboard if so
class ConfirmationRequest : public Awaitable {
public:
    static constexpr const char* kTypeName = "ConfirmationRequest";

    ConfirmationRequest(DomainObjectPtr payload, std::string message)
        : payload_(std::move(payload)), message_(std::move(message)) {}

    std::string type_name() const override { return kTypeName; }
    std::vector<std::string> supertypes() const override { return {Awaitable::kTypeName}; }

    const DomainObjectPtr& payload() const { return payload_; }
    std::string message() const override { return message_; }

    ResponseImpact on_response(bool accepted, blackboard::Blackboard& blackboard) const override;

    Json to_json() const override;

private:
    DomainObjectPtr payload_;
    std::string message_;
};

}  // namespace goapagent::model
