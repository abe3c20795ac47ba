#pragma once

#include "runsync/core/cancellation.hpp"
#include "runsync/core/result.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace runsync::transfer {

/**
 * @brief One timed mutex per key, created on first use
 *
 * Serializes transfers that would race on the same target paths or keys
 * (one coordinate and kind). Entries live as long as the table.
 */
class KeyLockTable {
public:
    class Guard {
    public:
        Guard() = default;
        explicit Guard(std::shared_ptr<std::timed_mutex> mutex) : mutex_(std::move(mutex)) {}
        ~Guard() { release(); }

        Guard(Guard&& other) noexcept : mutex_(std::move(other.mutex_)) {}
        Guard& operator=(Guard&& other) noexcept {
            if (this != &other) {
                release();
                mutex_ = std::move(other.mutex_);
            }
            return *this;
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        bool owns_lock() const noexcept { return mutex_ != nullptr; }

    private:
        void release() noexcept {
            if (mutex_) {
                mutex_->unlock();
                mutex_.reset();
            }
        }

        std::shared_ptr<std::timed_mutex> mutex_;
    };

    /**
     * @brief Wait for the key's lock
     *
     * Gives up with Cancelled when the token fires (explicitly or through its
     * deadline) or after `timeout`, whichever comes first.
     */
    Result<Guard> acquire(const std::string& key,
                          const CancellationToken& token,
                          std::chrono::milliseconds timeout);

    std::size_t size() const;

private:
    static constexpr std::chrono::milliseconds kPollInterval{50};

    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> locks_;
};

} // namespace runsync::transfer
