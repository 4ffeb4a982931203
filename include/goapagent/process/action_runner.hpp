#pragma once

#include "process_context.hpp"
#include "goapagent/model/action.hpp"

namespace goapagent::process {

// Runs an action body under its QoS retry policy and binds the result.
//  - Completed: bound to the single declared output name, or added when the
//    name is "it" or there is not exactly one output
//  - Waiting: the awaitable is added and the action reports WAITING at once
//  - Failed or a thrown std::exception: retried until attempts run out
class ActionRunner {
public:
    static model::ActionStatus execute(ProcessContext& context,
                                       const model::Action& action,
                                       const model::ActionBody& body);
};

}  // namespace goapagent::process
