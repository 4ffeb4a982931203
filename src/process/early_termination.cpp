#include "goapagent/process/early_termination.hpp"
#include "goapagent/process/agent_process.hpp"
#include "goapagent/core/errors.hpp"

#include <spdlog/fmt/fmt.h>

namespace goapagent::process {

namespace {

template<typename T>
T require_non_negative(T limit, const char* policy) {
    if (limit < 0) {
        throw UsageError(ErrorCode::InvalidArgument,
                         fmt::format("{} limit must not be negative: {}", policy, limit));
    }
    return limit;
}

class MaxActionsEarlyTerminationPolicy : public EarlyTerminationPolicy {
public:
    explicit MaxActionsEarlyTerminationPolicy(int max) : max_(max) {}

    std::string name() const override { return fmt::format("MaxActions({})", max_); }

    std::optional<EarlyTermination> should_terminate(const AgentProcess& process) const override {
        if (process.history_size() >= static_cast<size_t>(max_)) {
            return terminate(process, "Max actions reached");
        }
        return std::nullopt;
    }

private:
    int max_;
};

class MaxTokensEarlyTerminationPolicy : public EarlyTerminationPolicy {
public:
    explicit MaxTokensEarlyTerminationPolicy(int max) : max_(max) {}

    std::string name() const override { return fmt::format("MaxTokens({})", max_); }

    std::optional<EarlyTermination> should_terminate(const AgentProcess& process) const override {
        if (process.total_tokens() >= static_cast<int64_t>(max_)) {
            return terminate(process, fmt::format("Max tokens reached: {} >= {}", process.total_tokens(), max_));
        }
        return std::nullopt;
    }

private:
    int max_;
};

class HardBudgetLimitTerminationPolicy : public EarlyTerminationPolicy {
public:
    explicit HardBudgetLimitTerminationPolicy(double budget) : budget_(budget) {}

    std::string name() const override { return fmt::format("HardBudgetLimit({:.4f})", budget_); }

    std::optional<EarlyTermination> should_terminate(const AgentProcess& process) const override {
        double cost = process.cost();
        if (cost >= budget_) {
            return terminate(process, fmt::format("Budget exceeded: cost {:.4f} >= {:.4f}", cost, budget_));
        }
        return std::nullopt;
    }

private:
    double budget_;
};

class FirstOfEarlyTerminationPolicy : public EarlyTerminationPolicy {
public:
    explicit FirstOfEarlyTerminationPolicy(std::vector<EarlyTerminationPolicyPtr> policies)
        : policies_(std::move(policies)) {}

    std::string name() const override {
        std::string names;
        for (const auto& policy : policies_) {
            if (!names.empty()) {
                names += ", ";
            }
            names += policy->name();
        }
        return "FirstOf(" + names + ")";
    }

    std::optional<EarlyTermination> should_terminate(const AgentProcess& process) const override {
        for (const auto& policy : policies_) {
            if (auto termination = policy->should_terminate(process)) {
                return termination;
            }
        }
        return std::nullopt;
    }

private:
    std::vector<EarlyTerminationPolicyPtr> policies_;
};

}  // namespace

EarlyTermination EarlyTerminationPolicy::terminate(const AgentProcess& process, std::string reason) const {
    return EarlyTermination{process.id(), std::move(reason), weak_from_this().lock(), name()};
}

EarlyTerminationPolicyPtr EarlyTerminationPolicy::max_actions(int max) {
    return std::make_shared<MaxActionsEarlyTerminationPolicy>(require_non_negative(max, "MaxActions"));
}

EarlyTerminationPolicyPtr EarlyTerminationPolicy::max_tokens(int max) {
    return std::make_shared<MaxTokensEarlyTerminationPolicy>(require_non_negative(max, "MaxTokens"));
}

EarlyTerminationPolicyPtr EarlyTerminationPolicy::hard_budget_limit(double budget) {
    return std::make_shared<HardBudgetLimitTerminationPolicy>(require_non_negative(budget, "HardBudgetLimit"));
}

EarlyTerminationPolicyPtr EarlyTerminationPolicy::first_of(std::vector<EarlyTerminationPolicyPtr> policies) {
    return std::make_shared<FirstOfEarlyTerminationPolicy>(std::move(policies));
}

}  // namespace goapagent::process
