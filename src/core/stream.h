// core/stream.h
#ifndef AGENTGRAPH_CORE_STREAM_H
#define AGENTGRAPH_CORE_STREAM_H

#include "core/types/event.h"
#include "core/types/errors.h"
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

namespace agentgraph {

class ExecutionSession;

// Lazy, pull-driven event sequence of one run. Each next() executes at most one node,
// so nothing runs ahead of the consumer. Move-only.
class GraphStream {
public:
    explicit GraphStream(std::unique_ptr<ExecutionSession> session);
    ~GraphStream();
    GraphStream(GraphStream&&) noexcept;
    GraphStream& operator=(GraphStream&&) noexcept;

    // std::nullopt when the run ended (completed or cancelled); failures are thrown
    std::optional<GraphEvent> next();

    // Stops the run at the next step boundary. The sequence then ends without GRAPH_COMPLETED.
    void cancel();

    RunStatus status() const;
    const AgentState& state() const;
    const std::string& execution_id() const;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = GraphEvent;
        using difference_type = std::ptrdiff_t;
        using pointer = const GraphEvent*;
        using reference = const GraphEvent&;

        iterator() = default;
        explicit iterator(GraphStream* stream) : stream_(stream) { ++*this; }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            current_ = stream_->next();
            return *this;
        }
        void operator++(int) { ++*this; }

        bool operator==(std::default_sentinel_t) const { return !current_.has_value(); }

    private:
        GraphStream* stream_ = nullptr;
        std::optional<GraphEvent> current_;
    };

    iterator begin() { return iterator(this); }
    std::default_sentinel_t end() { return {}; }

private:
    std::unique_ptr<ExecutionSession> session_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_STREAM_H
