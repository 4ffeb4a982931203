#include "goapagent/model/awaitable.hpp"
#include "goapagent/core/uuid.hpp"

#include <spdlog/spdlog.h>

namespace goapagent::model {

Awaitable::Awaitable() : id_(UUID::generate().to_string()) {}

Json Awaitable::to_json() const {
    return Json{
        {"type", type_name()},
        {"id", id_},
        {"message", message()}
    };
}

ResponseImpact ConfirmationRequest::on_response(bool accepted, blackboard::Blackboard& blackboard) const {
    if (!accepted) {
        spdlog::info("Confirmation {} rejected", id());
        return ResponseImpact::Unchanged;
    }
    if (payload_) {
        blackboard.add_object(payload_);
    }
    spdlog::info("Confirmation {} accepted", id());
    return ResponseImpact::Updated;
}

Json ConfirmationRequest::to_json() const {
    auto json = Awaitable::to_json();
    json["payload"] = payload_ ? payload_->to_json() : Json();
    return json;
}

}  // namespace goapagent::model
