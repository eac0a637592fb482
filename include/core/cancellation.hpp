#pragma once

#include <atomic>
#include <memory>

namespace gv {

/**
 * @brief Read side of a cooperative cancellation flag
 *
 * Cancellation is advisory: work that receives a token is expected to poll
 * is_cancelled() and stop early, nothing is interrupted forcibly.
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    bool is_cancelled() const { return state_->load(); }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> state)
        : state_(std::move(state)) {}

    std::shared_ptr<std::atomic<bool>> state_;
};

/**
 * @brief Write side; hands out tokens sharing one flag
 */
class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken token() const { return CancellationToken(state_); }

    void cancel() { state_->store(true); }

    bool is_cancelled() const { return state_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace gv
