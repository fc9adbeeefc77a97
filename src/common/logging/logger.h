#ifndef AGENTGRAPH_COMMON_LOGGING_LOGGER_H
#define AGENTGRAPH_COMMON_LOGGING_LOGGER_H

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace agentgraph {

struct LoggingConfig {
    std::string level = "info";                          // trace|debug|info|warn|error|critical|off
    std::string pattern = "%Y-%m-%dT%H:%M:%S.%e [%^%l%$] [%n] %v";
};

// Named "agentgraph" logger; created on first use with AGENTGRAPH_LOG_LEVEL / AGENTGRAPH_LOG_PATTERN
std::shared_ptr<spdlog::logger> logger();

// Re-applies level and pattern; environment variables still take precedence
void init_logging(const LoggingConfig& config);

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_LOGGING_LOGGER_H
