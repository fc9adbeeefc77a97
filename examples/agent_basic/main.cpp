// main.cpp
// Classify a user request, answer it through one of two branches and export the traces.
#include <iostream>
#include <fstream>
#include <nlohmann/json.hpp>
#include "agentgraph/agentgraph.h"

using namespace agentgraph;

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [engine.yaml]\n";
        return 1;
    }

    try {
        // 1. 配置
        EngineConfig config;
        if (argc == 2) {
            config = load_engine_config_file(argv[1]);
        }
        init_logging(config.logging);

        // 2. 构建图
        auto checkpoints = std::make_shared<InMemoryCheckpointStore>(config.checkpoints.max_checkpoints);

        GraphBuilder builder("classify");
        builder
            .add_node("start", [](const AgentState& s) {
                return s.with_message("system", "request received");
            })
            .add_node("classify", [](const AgentState& s) {
                const std::string& text = s.messages.front().content;
                const bool is_search = text.find("find") != std::string::npos ||
                                       text.find("search") != std::string::npos;
                return s.with("intent", is_search ? "search" : "chat");
            })
            .add_node("search", [](const AgentState& s) {
                return s.with("response", "Here is what I found for: " + s.messages.front().content);
            })
            .add_node("respond", [](const AgentState& s) {
                AgentState next = s;
                if (!next.has("response")) {
                    next.values["response"] = "Happy to chat!";
                }
                return next.with_message("assistant", next.values["response"].get<std::string>());
            })
            .add_edge("start", "classify")
            .add_conditional_edge("classify", when("values.intent == \"search\"", "search"), {"search"})
            .add_conditional_edge("classify", otherwise("respond"), {"respond"})
            .add_edge("search", "respond")
            .set_entry_point("start")
            .add_exit_point("respond");

        auto graph = builder.compile(checkpoints);

        // 3. 执行 (streaming)
        AgentState initial;
        initial.messages.push_back(Message{"user", "please find the release notes"});

        GraphExecutionOptions options = config.execution;
        options.enable_checkpoints = true;

        auto stream = graph->stream(initial, options);
        for (const auto& event : stream) {
            std::cout << "  " << event_to_json(event).dump() << "\n";
        }

        // 4. 输出结果
        const AgentState& final_state = stream.state();
        std::cout << "[SUCCESS] " << to_string(stream.status()) << "\n";
        std::cout << "Final state:\n" << nlohmann::json(final_state).dump(2) << "\n\n";

        // 5. 再次执行并导出 Trace 到文件
        auto result = graph->run(initial, config.execution);
        if (!result.success()) {
            std::cerr << "[ERROR] " << result.message << "\n";
            return 1;
        }
        std::ofstream trace_file("execution_trace.json");
        trace_file << TraceExporter::to_json(result.traces).dump(2) << std::endl;
        std::cout << "Trace exported to execution_trace.json (" << result.traces.size() << " records)\n";

    } catch (const GraphValidationError& e) {
        std::cerr << "[INVALID GRAPH]\n";
        for (const auto& v : e.violations()) {
            std::cerr << "  - " << v << "\n";
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
