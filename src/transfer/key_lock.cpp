#include "runsync/transfer/key_lock.hpp"

#include <algorithm>

namespace runsync::transfer {

Result<KeyLockTable::Guard> KeyLockTable::acquire(const std::string& key,
                                                  const CancellationToken& token,
                                                  std::chrono::milliseconds timeout) {
    std::shared_ptr<std::timed_mutex> mutex;
    {
        std::lock_guard lock(table_mutex_);
        auto& slot = locks_[key];
        if (!slot) {
            slot = std::make_shared<std::timed_mutex>();
        }
        mutex = slot;
    }

    const auto give_up_at = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (token.is_cancelled()) {
            return Err<Guard>(ErrorCode::Cancelled, "Cancelled while waiting for transfer lock", key);
        }

        const auto remaining = give_up_at - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::steady_clock::duration::zero()) {
            return Err<Guard>(ErrorCode::Cancelled,
                              "Timed out after " + std::to_string(timeout.count()) + "ms waiting for transfer lock",
                              key);
        }

        const auto wait = std::min<std::chrono::steady_clock::duration>(remaining, kPollInterval);
        if (mutex->try_lock_for(wait)) {
            return Ok(Guard(std::move(mutex)));
        }
    }
}

std::size_t KeyLockTable::size() const {
    std::lock_guard lock(table_mutex_);
    return locks_.size();
}

} // namespace runsync::transfer
