#pragma once

#include "goapagent/core/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace goapagent::process {

using namespace goapagent::core;

class AgentProcess;
class EarlyTerminationPolicy;
using EarlyTerminationPolicyPtr = std::shared_ptr<const EarlyTerminationPolicy>;

// Why a policy stopped a process
struct EarlyTermination {
    ProcessId process_id;
    std::string reason;
    // The policy that fired; null for a policy not owned by a shared_ptr
    EarlyTerminationPolicyPtr policy;
    std::string policy_name;
    TimePoint timestamp = Clock::now();

    Json to_json() const {
        return Json{
            {"process_id", process_id},
            {"reason", reason},
            {"policy", policy_name},
            {"timestamp", to_epoch_millis(timestamp)}
        };
    }
};

// Checked before every tick
class EarlyTerminationPolicy : public std::enable_shared_from_this<EarlyTerminationPolicy> {
public:
    virtual ~EarlyTerminationPolicy() = default;

    virtual std::string name() const = 0;

    virtual std::optional<EarlyTermination> should_terminate(const AgentProcess& process) const = 0;

    // Stop once `max` actions have run. Negative limits throw UsageError,
    // as do those of max_tokens and hard_budget_limit.
    static EarlyTerminationPolicyPtr max_actions(int max);

    // Stop once `max` LLM tokens have been used
    static EarlyTerminationPolicyPtr max_tokens(int max);

    // Stop once accumulated cost reaches `budget`
    static EarlyTerminationPolicyPtr hard_budget_limit(double budget);

    // First policy that fires wins
    static EarlyTerminationPolicyPtr first_of(std::vector<EarlyTerminationPolicyPtr> policies);

protected:
    EarlyTermination terminate(const AgentProcess& process, std::string reason) const;
};

}  // namespace goapagent::process
