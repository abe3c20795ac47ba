#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace runsync {

/**
 * @brief Read-only view of a cancellation signal with an optional deadline
 *
 * Remote I/O and lock waits poll is_cancelled() between chunks; a token that
 * carries a deadline reports cancelled once the deadline has passed.
 * A default-constructed token never cancels.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const noexcept {
        if (flag_ && flag_->load(std::memory_order_acquire)) {
            return true;
        }
        return deadline_.has_value() && Clock::now() >= *deadline_;
    }

    [[nodiscard]] bool deadline_expired() const noexcept {
        return deadline_.has_value() && Clock::now() >= *deadline_;
    }

    [[nodiscard]] const std::optional<Clock::time_point>& deadline() const noexcept { return deadline_; }

    /**
     * @brief Same signal, deadline tightened to now + timeout
     */
    [[nodiscard]] CancellationToken with_timeout(Clock::duration timeout) const {
        CancellationToken copy = *this;
        const auto candidate = Clock::now() + timeout;
        if (!copy.deadline_ || candidate < *copy.deadline_) {
            copy.deadline_ = candidate;
        }
        return copy;
    }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<const std::atomic<bool>> flag_;
    std::optional<Clock::time_point> deadline_;
};

class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

    [[nodiscard]] CancellationToken token() const { return CancellationToken(flag_); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace runsync
