#include "goapagent/core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <memory>
#include <vector>

namespace goapagent::core {

spdlog::level::level_enum parse_log_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void init_logging(const ObservabilityConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.color) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    } else {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
    }

    if (!config.log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                expand_path(config.log_file).string(),
                config.max_file_size_mb * 1024 * 1024,
                config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}", config.log_file.string(), e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("goapagent", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    spdlog::set_default_logger(logger);
    set_log_level(parse_log_level(config.log_level));
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

}  // namespace goapagent::core
