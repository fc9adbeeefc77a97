// modules/trace/trace_exporter.h
#ifndef AGENTGRAPH_MODULES_TRACE_TRACE_EXPORTER_H
#define AGENTGRAPH_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/context.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace agentgraph {

struct TraceRecord {
    std::string execution_id;
    NodeName node;
    int step = 0;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status; // "running", "success", "failed"
    std::optional<std::string> error;
    nlohmann::json values_delta;     // 执行前后 values 的变化, removed keys map to null
    std::optional<std::string> checkpoint_id;
    nlohmann::json budget_snapshot;
};

// Collects one TraceRecord per executed node of a single run
class TraceExporter {
public:
    explicit TraceExporter(std::string execution_id = {}) : execution_id_(std::move(execution_id)) {}

    void on_node_start(const NodeName& node, int step, const nlohmann::json& budget);

    void on_node_end(
        const NodeName& node,
        const std::string& status,
        const std::optional<std::string>& error,
        const ValueMap& before,
        const ValueMap& after,
        const std::optional<std::string>& checkpoint_id,
        const nlohmann::json& budget
    );

    const std::vector<TraceRecord>& get_traces() const { return traces_; }
    void clear_traces() { traces_.clear(); }

    static nlohmann::json to_json(const std::vector<TraceRecord>& traces);
    static nlohmann::json calculate_values_delta(const ValueMap& before, const ValueMap& after);

private:
    std::string execution_id_;
    std::vector<TraceRecord> traces_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_TRACE_TRACE_EXPORTER_H
