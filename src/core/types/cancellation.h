#ifndef AGENTGRAPH_TYPES_CANCELLATION_H
#define AGENTGRAPH_TYPES_CANCELLATION_H

#include <atomic>
#include <memory>

namespace agentgraph {

// Cooperative cancellation. The engine checks the token between nodes only;
// handlers that block on I/O may poll it themselves.
class CancellationToken {
public:
    CancellationToken() = default; // never cancelled

    bool is_cancelled() const {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

    bool can_be_cancelled() const { return static_cast<bool>(flag_); }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }
    bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

    CancellationToken token() const { return CancellationToken(flag_); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_TYPES_CANCELLATION_H
