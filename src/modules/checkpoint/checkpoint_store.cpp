// modules/checkpoint/checkpoint_store.cpp
#include "modules/checkpoint/checkpoint_store.h"
#include "common/logging/logger.h"
#include <algorithm>
#include <stdexcept>

namespace agentgraph {

nlohmann::json checkpoint_to_json(const Checkpoint& checkpoint) {
    return nlohmann::json{
        {"checkpoint_id", checkpoint.checkpoint_id},
        {"execution_id", checkpoint.execution_id},
        {"state", checkpoint.state},
        {"step", checkpoint.step},
        {"created_at_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                              checkpoint.created_at.time_since_epoch()).count()}
    };
}

Checkpoint checkpoint_from_json(const nlohmann::json& j) {
    Checkpoint checkpoint;
    checkpoint.checkpoint_id = j.at("checkpoint_id").get<std::string>();
    checkpoint.execution_id = j.value("execution_id", "");
    checkpoint.state = j.at("state").get<AgentState>();
    checkpoint.step = j.value("step", checkpoint.state.step);
    checkpoint.created_at = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(j.value("created_at_ms", 0LL)));
    return checkpoint;
}

InMemoryCheckpointStore::InMemoryCheckpointStore(std::size_t max_checkpoints)
    : max_checkpoints_(max_checkpoints) {}

void InMemoryCheckpointStore::save(const Checkpoint& checkpoint) {
    if (checkpoint.checkpoint_id.empty()) {
        throw std::invalid_argument("Checkpoint ID cannot be empty");
    }
    // Serialise outside the lock; a value that JSON cannot encode throws here
    std::string document = checkpoint_to_json(checkpoint).dump();

    std::lock_guard<std::mutex> lock(mutex_);
    const bool inserted = documents_.insert_or_assign(checkpoint.checkpoint_id, std::move(document)).second;
    if (!inserted) {
        order_.erase(std::remove(order_.begin(), order_.end(), checkpoint.checkpoint_id), order_.end());
    }
    order_.push_back(checkpoint.checkpoint_id);
    enforce_limit_locked();
}

std::optional<Checkpoint> InMemoryCheckpointStore::load(const std::string& checkpoint_id) const {
    std::string document;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = documents_.find(checkpoint_id);
        if (it == documents_.end()) {
            return std::nullopt;
        }
        document = it->second;
    }
    return checkpoint_from_json(nlohmann::json::parse(document));
}

std::vector<Checkpoint> InMemoryCheckpointStore::list(const std::string& execution_id) const {
    std::vector<std::string> documents;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : order_) {
            documents.push_back(documents_.at(id));
        }
    }

    std::vector<Checkpoint> result;
    for (const auto& doc : documents) {
        auto checkpoint = checkpoint_from_json(nlohmann::json::parse(doc));
        if (checkpoint.execution_id == execution_id) {
            result.push_back(std::move(checkpoint));
        }
    }
    return result;
}

bool InMemoryCheckpointStore::remove(const std::string& checkpoint_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (documents_.erase(checkpoint_id) == 0) {
        return false;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), checkpoint_id), order_.end());
    return true;
}

std::size_t InMemoryCheckpointStore::remove_older_than(std::chrono::system_clock::time_point cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = order_.begin(); it != order_.end();) {
        auto checkpoint = checkpoint_from_json(nlohmann::json::parse(documents_.at(*it)));
        if (checkpoint.created_at < cutoff) {
            documents_.erase(*it);
            it = order_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t InMemoryCheckpointStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return documents_.size();
}

void InMemoryCheckpointStore::enforce_limit_locked() {
    if (max_checkpoints_ == 0) return;
    while (order_.size() > max_checkpoints_) {
        logger()->debug("Evicting checkpoint '{}' (limit {})", order_.front(), max_checkpoints_);
        documents_.erase(order_.front());
        order_.pop_front();
    }
}

} // namespace agentgraph
