#pragma once

#include "config.hpp"

#include <spdlog/spdlog.h>

#include <string_view>

namespace goapagent::core {

// Install the default logger: colored console, plus a rotating file when configured
void init_logging(const ObservabilityConfig& config);

void set_log_level(spdlog::level::level_enum level);

// Unrecognized names map to info
spdlog::level::level_enum parse_log_level(std::string_view name);

}  // namespace goapagent::core
