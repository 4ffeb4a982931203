#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <string>

namespace goapagent::core {

namespace fs = std::filesystem;

// Logging configuration
struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error, off
    fs::path log_file;               // Empty: console only
    bool color = true;
    size_t max_file_size_mb = 10;
    size_t max_files = 3;
};

// Default budget for agent processes
struct BudgetConfig {
    double cost = 2.0;
    int actions = 50;
    int tokens = 1000000;
};

// Default process behaviour
struct ProcessConfig {
    bool allow_goal_change = true;
    bool test = false;
    bool show_prompts = false;
    bool show_llm_responses = false;
    bool debug = false;
    int tool_delay_ms = 0;
    int operation_delay_ms = 0;
};

// Planner limits
struct PlannerConfig {
    int max_iterations = 10000;
};

// Default action retry policy
struct QosConfig {
    int max_attempts = 5;
    int backoff_ms = 10000;
    double backoff_multiplier = 5.0;
    int backoff_max_ms = 60000;
};

// Concurrency configuration
struct ConcurrencyConfig {
    int thread_pool_size = 4;
};

// Main configuration
struct Config {
    ObservabilityConfig observability;
    BudgetConfig budget;
    ProcessConfig process;
    PlannerConfig planner;
    QosConfig qos;
    ConcurrencyConfig concurrency;

    // Load configuration from file
    static Result<Config, Error> load(const fs::path& path);

    // Load with defaults, falling back if file doesn't exist
    static Config load_or_default(const fs::path& path);

    // Save configuration to file
    Result<void, Error> save(const fs::path& path) const;

    // ~/.goapagent/config.yaml
    static fs::path default_path();

    // GOAPAGENT_LOG_LEVEL and GOAPAGENT_MAX_ACTIONS
    void apply_environment();

    Result<void, Error> validate() const;
};

// Expand ~, ${VAR} and $VAR
std::string expand_path(const std::string& path);
fs::path expand_path(const fs::path& path);

}  // namespace goapagent::core
