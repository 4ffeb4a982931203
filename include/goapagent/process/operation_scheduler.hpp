#pragma once

#include "process_options.hpp"
#include "goapagent/model/action.hpp"

#include <memory>

namespace goapagent::process {

// When an action may run
struct OperationSchedule {
    enum class Kind {
        Pronto,     // Now
        Delayed,    // After `delay`, on the calling thread
        Scheduled   // Not in this run; the process pauses
    };

    Kind kind = Kind::Pronto;
    Duration delay{0};
    TimePoint at{};

    static OperationSchedule pronto() { return OperationSchedule{}; }

    static OperationSchedule delayed(Duration delay) {
        return OperationSchedule{Kind::Delayed, delay, {}};
    }

    static OperationSchedule scheduled(TimePoint at) {
        return OperationSchedule{Kind::Scheduled, Duration(0), at};
    }
};

class OperationScheduler {
public:
    virtual ~OperationScheduler() = default;

    virtual OperationSchedule schedule_action(const model::Action& action,
                                              const ProcessOptions& options) = 0;
};

using OperationSchedulerPtr = std::shared_ptr<OperationScheduler>;

// Runs everything now unless ProcessControl asks for pacing.
// Actions with tool groups also wait the tool delay.
class ProntoOperationScheduler : public OperationScheduler {
public:
    OperationSchedule schedule_action(const model::Action& action,
                                      const ProcessOptions& options) override {
        auto delay = options.control.operation_delay;
        if (!action.tool_groups().empty()) {
            delay += options.control.tool_delay;
        }
        if (delay.count() > 0) {
            return OperationSchedule::delayed(delay);
        }
        return OperationSchedule::pronto();
    }
};

}  // namespace goapagent::process
