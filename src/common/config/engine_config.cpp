// common/config/engine_config.cpp
#include "common/config/engine_config.h"
#include "common/utils/yaml_json.h"
#include <fstream>
#include <sstream>

namespace agentgraph {

namespace {

const nlohmann::json* section(const nlohmann::json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ConfigError(std::string("'") + name + "' must be a mapping");
    }
    return &*it;
}

template <typename T>
bool read_field(const nlohmann::json& obj, const char* section_name, const char* key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return false;
    }
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception&) {
        throw ConfigError(std::string(section_name) + "." + key + ": unexpected type " + it->type_name());
    }
    return true;
}

void read_execution(const nlohmann::json& j, GraphExecutionOptions& options) {
    if (j.contains("max_steps") && !j["max_steps"].is_number_integer()) {
        throw ConfigError("execution.max_steps: expected an integer");
    }
    read_field(j, "execution", "max_steps", options.max_steps);
    if (options.max_steps <= 0) {
        throw ConfigError("execution.max_steps must be positive");
    }

    long long timeout_ms = 0;
    if (read_field(j, "execution", "timeout_ms", timeout_ms)) {
        if (timeout_ms < 0) {
            throw ConfigError("execution.timeout_ms must not be negative");
        }
        options.timeout = std::chrono::milliseconds(timeout_ms);
    }
    read_field(j, "execution", "enable_checkpoints", options.enable_checkpoints);
    read_field(j, "execution", "checkpoint_id", options.checkpoint_id);
    read_field(j, "execution", "execution_id", options.execution_id);
}

void read_supervisor(const nlohmann::json& j, SupervisorConfig& config) {
    std::string strategy;
    if (read_field(j, "supervisor", "default_strategy", strategy)) {
        auto parsed = parse_strategy(strategy);
        if (!parsed) {
            throw ConfigError("supervisor.default_strategy: unknown strategy '" + strategy + "'");
        }
        config.default_strategy = *parsed;
    }
    read_field(j, "supervisor", "task_id_prefix", config.task_id_prefix);
    if (config.task_id_prefix.empty()) {
        throw ConfigError("supervisor.task_id_prefix must not be empty");
    }
}

void read_checkpoints(const nlohmann::json& j, CheckpointConfig& config) {
    long long max_checkpoints = 0;
    if (read_field(j, "checkpoints", "max_checkpoints", max_checkpoints)) {
        if (max_checkpoints < 0) {
            throw ConfigError("checkpoints.max_checkpoints must not be negative");
        }
        config.max_checkpoints = static_cast<std::size_t>(max_checkpoints);
    }
}

void read_logging(const nlohmann::json& j, LoggingConfig& config) {
    read_field(j, "logging", "level", config.level);
    read_field(j, "logging", "pattern", config.pattern);
}

} // namespace

EngineConfig load_engine_config_string(const std::string& yaml_text) {
    nlohmann::json root;
    try {
        root = yaml_to_json(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid YAML: ") + e.what());
    }

    EngineConfig config;
    if (root.is_null()) {
        return config; // empty document
    }
    if (!root.is_object()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    if (const auto* j = section(root, "execution")) read_execution(*j, config.execution);
    if (const auto* j = section(root, "supervisor")) read_supervisor(*j, config.supervisor);
    if (const auto* j = section(root, "checkpoints")) read_checkpoints(*j, config.checkpoints);
    if (const auto* j = section(root, "logging")) read_logging(*j, config.logging);
    return config;
}

EngineConfig load_engine_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_engine_config_string(buffer.str());
}

} // namespace agentgraph
