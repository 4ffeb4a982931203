#include "goapagent/core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace goapagent::core {

std::string expand_path(const std::string& path) {
    std::string result = path;

    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // ${VAR}
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    // $VAR
    std::regex env_regex2(R"(\$([A-Za-z_][A-Za-z0-9_]*))");
    while (std::regex_search(result, match, env_regex2)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

fs::path expand_path(const fs::path& path) {
    return fs::path(expand_path(path.string()));
}

fs::path Config::default_path() {
    return expand_path(fs::path("~/.goapagent/config.yaml"));
}

void Config::apply_environment() {
    if (const char* level = std::getenv("GOAPAGENT_LOG_LEVEL")) {
        observability.log_level = level;
    }
    if (const char* max_actions = std::getenv("GOAPAGENT_MAX_ACTIONS")) {
        char* end = nullptr;
        long parsed = std::strtol(max_actions, &end, 10);
        if (end != max_actions && *end == '\0' && parsed > 0) {
            budget.actions = static_cast<int>(parsed);
        }
    }
}

Result<void, Error> Config::validate() const {
    static const std::regex levels("trace|debug|info|warn|error|critical|off");
    if (!std::regex_match(observability.log_level, levels)) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "observability.log_level must be one of trace, debug, info, warn, error, critical, off",
            observability.log_level
        );
    }

    if (budget.cost < 0.0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "budget.cost must not be negative"
        );
    }

    if (budget.actions <= 0 || budget.tokens <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "budget.actions and budget.tokens must be positive"
        );
    }

    if (qos.max_attempts < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "qos.max_attempts must be at least 1"
        );
    }

    if (qos.backoff_ms < 0 || qos.backoff_max_ms < 0 || qos.backoff_multiplier < 1.0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "qos backoff must be non-negative with a multiplier of at least 1"
        );
    }

    if (planner.max_iterations <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "planner.max_iterations must be positive"
        );
    }

    if (concurrency.thread_pool_size < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "concurrency.thread_pool_size must be at least 1"
        );
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = expand_path(path);

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        if (auto obs_node = root["observability"]) {
            config.observability.log_level = obs_node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_file = expand_path(obs_node["log_file"].as<std::string>(""));
            config.observability.color = obs_node["color"].as<bool>(config.observability.color);
            config.observability.max_file_size_mb = obs_node["max_file_size_mb"].as<size_t>(config.observability.max_file_size_mb);
            config.observability.max_files = obs_node["max_files"].as<size_t>(config.observability.max_files);
        }

        if (auto budget_node = root["budget"]) {
            config.budget.cost = budget_node["cost"].as<double>(config.budget.cost);
            config.budget.actions = budget_node["actions"].as<int>(config.budget.actions);
            config.budget.tokens = budget_node["tokens"].as<int>(config.budget.tokens);
        }

        if (auto proc_node = root["process"]) {
            config.process.allow_goal_change = proc_node["allow_goal_change"].as<bool>(config.process.allow_goal_change);
            config.process.test = proc_node["test"].as<bool>(config.process.test);
            config.process.show_prompts = proc_node["show_prompts"].as<bool>(config.process.show_prompts);
            config.process.show_llm_responses = proc_node["show_llm_responses"].as<bool>(config.process.show_llm_responses);
            config.process.debug = proc_node["debug"].as<bool>(config.process.debug);
            config.process.tool_delay_ms = proc_node["tool_delay_ms"].as<int>(config.process.tool_delay_ms);
            config.process.operation_delay_ms = proc_node["operation_delay_ms"].as<int>(config.process.operation_delay_ms);
        }

        if (auto planner_node = root["planner"]) {
            config.planner.max_iterations = planner_node["max_iterations"].as<int>(config.planner.max_iterations);
        }

        if (auto qos_node = root["qos"]) {
            config.qos.max_attempts = qos_node["max_attempts"].as<int>(config.qos.max_attempts);
            config.qos.backoff_ms = qos_node["backoff_ms"].as<int>(config.qos.backoff_ms);
            config.qos.backoff_multiplier = qos_node["backoff_multiplier"].as<double>(config.qos.backoff_multiplier);
            config.qos.backoff_max_ms = qos_node["backoff_max_ms"].as<int>(config.qos.backoff_max_ms);
        }

        if (auto conc_node = root["concurrency"]) {
            config.concurrency.thread_pool_size = conc_node["thread_pool_size"].as<int>(config.concurrency.thread_pool_size);
        }

        // Environment wins over the file
        config.apply_environment();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(validation.error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    Config config;
    config.apply_environment();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    fs::path expanded = expand_path(path);

    try {
        if (expanded.has_parent_path()) {
            fs::create_directories(expanded.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            expanded.string()
        );
    }

    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
    out << YAML::Key << "log_file" << YAML::Value << observability.log_file.string();
    out << YAML::Key << "color" << YAML::Value << observability.color;
    out << YAML::EndMap;

    out << YAML::Key << "budget" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "cost" << YAML::Value << budget.cost;
    out << YAML::Key << "actions" << YAML::Value << budget.actions;
    out << YAML::Key << "tokens" << YAML::Value << budget.tokens;
    out << YAML::EndMap;

    out << YAML::Key << "process" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "allow_goal_change" << YAML::Value << process.allow_goal_change;
    out << YAML::Key << "test" << YAML::Value << process.test;
    out << YAML::Key << "tool_delay_ms" << YAML::Value << process.tool_delay_ms;
    out << YAML::Key << "operation_delay_ms" << YAML::Value << process.operation_delay_ms;
    out << YAML::EndMap;

    out << YAML::Key << "planner" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "max_iterations" << YAML::Value << planner.max_iterations;
    out << YAML::EndMap;

    out << YAML::Key << "qos" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "max_attempts" << YAML::Value << qos.max_attempts;
    out << YAML::Key << "backoff_ms" << YAML::Value << qos.backoff_ms;
    out << YAML::Key << "backoff_multiplier" << YAML::Value << qos.backoff_multiplier;
    out << YAML::Key << "backoff_max_ms" << YAML::Value << qos.backoff_max_ms;
    out << YAML::EndMap;

    out << YAML::Key << "concurrency" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "thread_pool_size" << YAML::Value << concurrency.thread_pool_size;
    out << YAML::EndMap;

    out << YAML::EndMap;

    std::ofstream file(expanded);
    if (!file) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            "Failed to open config file for writing",
            expanded.string()
        );
    }

    file << out.c_str();
    return Result<void, Error>::ok();
}

}  // namespace goapagent::core
