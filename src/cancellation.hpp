#pragma once

#include <atomic>
#include <memory>
#include <utility>

// Observer side of a cancellation flag. A default-constructed token is never cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const {
        return state_ && state_->load(std::memory_order_acquire);
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> state)
        : state_(std::move(state)) {}

    std::shared_ptr<const std::atomic<bool>> state_;
};

// Owner side. Tokens handed out stay valid after the source is destroyed.
class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken token() const { return CancellationToken(state_); }
    void cancel() { state_->store(true, std::memory_order_release); }
    bool is_cancelled() const { return state_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};
