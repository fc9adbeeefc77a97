// modules/checkpoint/checkpoint_store.h
#ifndef AGENTGRAPH_MODULES_CHECKPOINT_CHECKPOINT_STORE_H
#define AGENTGRAPH_MODULES_CHECKPOINT_CHECKPOINT_STORE_H

#include "core/types/context.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentgraph {

// Position of a run after a node completed. state.current_node is the node that completed.
struct Checkpoint {
    std::string checkpoint_id;
    std::string execution_id;
    AgentState state;
    int step = 0;
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
};

nlohmann::json checkpoint_to_json(const Checkpoint& checkpoint);
Checkpoint checkpoint_from_json(const nlohmann::json& j);

// Collaborator the engine calls after each node when checkpointing is enabled.
// Saving under an existing id replaces the previous checkpoint.
class CheckpointStore {
public:
    virtual ~CheckpointStore() = default;
    virtual void save(const Checkpoint& checkpoint) = 0;
    virtual std::optional<Checkpoint> load(const std::string& checkpoint_id) const = 0;
};

// Reference store for tests and single-process use. Checkpoints are kept in serialised
// JSON form, so anything that cannot round-trip through JSON fails at save time.
class InMemoryCheckpointStore : public CheckpointStore {
public:
    explicit InMemoryCheckpointStore(std::size_t max_checkpoints = 0); // 0 = unbounded

    void save(const Checkpoint& checkpoint) override;
    std::optional<Checkpoint> load(const std::string& checkpoint_id) const override;

    // Ordered by creation (oldest first)
    std::vector<Checkpoint> list(const std::string& execution_id) const;
    bool remove(const std::string& checkpoint_id);
    std::size_t remove_older_than(std::chrono::system_clock::time_point cutoff);
    std::size_t size() const;

private:
    void enforce_limit_locked();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> documents_;  // id -> serialised checkpoint
    std::deque<std::string> order_;                           // FIFO of ids
    std::size_t max_checkpoints_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_CHECKPOINT_CHECKPOINT_STORE_H
