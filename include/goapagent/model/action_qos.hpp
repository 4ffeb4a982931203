#pragma once

#include "goapagent/core/config.hpp"
#include "goapagent/core/types.hpp"

#include <algorithm>
#include <thread>

#include <spdlog/spdlog.h>

namespace goapagent::model {

using namespace goapagent::core;

// Calls an operation until it stops failing or attempts run out.
// Backoff grows by `multiplier` per attempt up to `backoff_max`.
// Holds no state between execute() calls.
class RetryTemplate {
public:
    RetryTemplate(int max_attempts, Duration backoff, double multiplier, Duration backoff_max)
        : max_attempts_(std::max(1, max_attempts))
        , backoff_(backoff)
        , multiplier_(multiplier)
        , backoff_max_(backoff_max)
    {
    }

    int max_attempts() const { return max_attempts_; }

    // `attempt(n)` is called with n = 1, 2, ... and must return a type with
    // is_failure(). The last result is returned whatever it is.
    template<typename F>
    auto execute(F&& attempt) const {
        auto delay = backoff_;
        for (int n = 1;; ++n) {
            auto result = attempt(n);
            if (!result.is_failure() || n >= max_attempts_) {
                return result;
            }
            spdlog::debug("Attempt {}/{} failed, retrying in {}ms", n, max_attempts_, delay.count());
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            auto next = static_cast<Duration::rep>(static_cast<double>(delay.count()) * multiplier_);
            delay = std::min(Duration(next), backoff_max_);
        }
    }

private:
    int max_attempts_;
    Duration backoff_;
    double multiplier_;
    Duration backoff_max_;
};

// Retry policy of one action
struct ActionQos {
    int max_attempts = 5;
    Duration backoff{10000};
    double backoff_multiplier = 5.0;
    Duration backoff_max{60000};
    bool idempotent = false;

    static ActionQos from_config(const QosConfig& config) {
        ActionQos qos;
        qos.max_attempts = config.max_attempts;
        qos.backoff = Duration(config.backoff_ms);
        qos.backoff_multiplier = config.backoff_multiplier;
        qos.backoff_max = Duration(config.backoff_max_ms);
        return qos;
    }

    // Single attempt, no backoff
    static ActionQos no_retry() {
        ActionQos qos;
        qos.max_attempts = 1;
        qos.backoff = Duration(0);
        return qos;
    }

    RetryTemplate retry_template() const {
        return RetryTemplate(max_attempts, backoff, backoff_multiplier, backoff_max);
    }

    Json to_json() const {
        return Json{
            {"max_attempts", max_attempts},
            {"backoff_ms", backoff.count()},
            {"backoff_multiplier", backoff_multiplier},
            {"backoff_max_ms", backoff_max.count()},
            {"idempotent", idempotent}
        };
    }
};

}  // namespace goapagent::model
