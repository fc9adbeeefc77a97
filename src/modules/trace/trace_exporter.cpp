// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"
#include <algorithm>

namespace agentgraph {

void TraceExporter::on_node_start(const NodeName& node, int step, const nlohmann::json& budget) {
    TraceRecord record;
    record.execution_id = execution_id_;
    record.node = node;
    record.step = step;
    record.start_time = std::chrono::system_clock::now();
    record.status = "running"; // updated in on_node_end
    record.values_delta = nlohmann::json::object();
    record.budget_snapshot = budget;
    traces_.push_back(std::move(record));
}

void TraceExporter::on_node_end(
    const NodeName& node,
    const std::string& status,
    const std::optional<std::string>& error,
    const ValueMap& before,
    const ValueMap& after,
    const std::optional<std::string>& checkpoint_id,
    const nlohmann::json& budget) {

    // Find the corresponding start record
    auto it = std::find_if(traces_.rbegin(), traces_.rend(),
                           [&node](const TraceRecord& r) { return r.node == node && r.status == "running"; });
    if (it == traces_.rend()) {
        return;
    }

    TraceRecord& record = *it;
    record.end_time = std::chrono::system_clock::now();
    record.status = status;
    record.error = error;
    record.values_delta = calculate_values_delta(before, after);
    record.checkpoint_id = checkpoint_id;
    record.budget_snapshot = budget;
}

nlohmann::json TraceExporter::calculate_values_delta(const ValueMap& before, const ValueMap& after) {
    nlohmann::json delta = nlohmann::json::object();
    for (const auto& [key, value] : after) {
        auto prev = before.find(key);
        if (prev == before.end() || prev->second != value) {
            delta[key] = value;
        }
    }
    for (const auto& [key, value] : before) {
        if (!after.count(key)) {
            delta[key] = nullptr; // deletion
        }
    }
    return delta;
}

nlohmann::json TraceExporter::to_json(const std::vector<TraceRecord>& traces) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& tr : traces) {
        nlohmann::json tj;
        tj["execution_id"] = tr.execution_id;
        tj["node"] = tr.node;
        tj["step"] = tr.step;
        tj["status"] = tr.status;
        tj["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
            tr.end_time - tr.start_time).count();
        tj["values_delta"] = tr.values_delta;
        tj["budget"] = tr.budget_snapshot;
        if (tr.error) {
            tj["error"] = *tr.error;
        }
        if (tr.checkpoint_id) {
            tj["checkpoint_id"] = *tr.checkpoint_id;
        }
        arr.push_back(std::move(tj));
    }
    return arr;
}

} // namespace agentgraph
