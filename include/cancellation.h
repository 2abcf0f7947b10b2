#pragma once

#include <atomic>
#include <memory>

namespace luna_voice {

/**
 * @brief Shared cancellation flag handed to asynchronous provider calls
 *
 * Copies share the same flag. A default-constructed token is live and
 * can be cancelled; cancel() is idempotent and safe from any thread.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true, std::memory_order_release); }

    bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

    /// Identity comparison: true when both tokens share one flag
    bool same_as(const CancellationToken& other) const { return flag_ == other.flag_; }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace luna_voice
