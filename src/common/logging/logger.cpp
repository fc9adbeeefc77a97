// common/logging/logger.cpp
#include "common/logging/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>

namespace agentgraph {

namespace {

constexpr const char* kLoggerName = "agentgraph";

std::string resolve_level(const LoggingConfig& config) {
    if (const char* level = std::getenv("AGENTGRAPH_LOG_LEVEL")) {
        return level;
    }
    return config.level;
}

std::string resolve_pattern(const LoggingConfig& config) {
    if (const char* pattern = std::getenv("AGENTGRAPH_LOG_PATTERN")) {
        return pattern;
    }
    return config.pattern;
}

void apply(spdlog::logger& log, const LoggingConfig& config) {
    log.set_pattern(resolve_pattern(config));
    log.set_level(spdlog::level::from_str(resolve_level(config)));
    log.flush_on(spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> create_logger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto log = spdlog::stdout_color_mt(kLoggerName);
    apply(*log, LoggingConfig{});
    return log;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
}

void init_logging(const LoggingConfig& config) {
    apply(*logger(), config);
}

} // namespace agentgraph
