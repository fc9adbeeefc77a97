// common/config/engine_config.h
#ifndef AGENTGRAPH_COMMON_CONFIG_ENGINE_CONFIG_H
#define AGENTGRAPH_COMMON_CONFIG_ENGINE_CONFIG_H

#include "common/logging/logger.h"
#include "core/types/budget.h"
#include "modules/delegation/supervisor.h"
#include <cstddef>
#include <stdexcept>
#include <string>

namespace agentgraph {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CheckpointConfig {
    std::size_t max_checkpoints = 0; // 0 = unbounded
};

// Example:
//   execution:   { max_steps: 50, timeout_ms: 30000, enable_checkpoints: true }
//   supervisor:  { default_strategy: priority_based, task_id_prefix: job }
//   checkpoints: { max_checkpoints: 100 }
//   logging:     { level: debug }
// Missing keys keep their defaults, unknown keys are ignored.
struct EngineConfig {
    GraphExecutionOptions execution;
    SupervisorConfig supervisor;
    CheckpointConfig checkpoints;
    LoggingConfig logging;
};

EngineConfig load_engine_config_string(const std::string& yaml_text);
EngineConfig load_engine_config_file(const std::string& path);

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_CONFIG_ENGINE_CONFIG_H
