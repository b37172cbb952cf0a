#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>

namespace tg {

/// Results completed by id on one thread and awaited on another
///
/// A waiter that times out abandons its id, so a result arriving later for
/// that id is dropped instead of being stored forever.
template <typename Result>
class PendingResults {
public:
    /// Store the result for `id` and wake waiters
    /// @return false if the id was abandoned and the result dropped
    bool complete(int64_t id, Result result) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (abandoned_.erase(id) > 0) {
                return false;
            }
            results_.insert_or_assign(id, std::move(result));
        }
        cv_.notify_all();
        return true;
    }

    /// Wait for the result of `id`; std::nullopt on timeout
    template <typename Rep, typename Period>
    std::optional<Result> wait(int64_t id, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);

        bool done = cv_.wait_for(lock, timeout, [this, id]() { return results_.count(id) > 0; });
        if (!done) {
            abandoned_.insert(id);
            return std::nullopt;
        }

        auto node = results_.extract(id);
        return std::move(node.mapped());
    }

    std::size_t stored() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return results_.size();
    }

    std::size_t abandoned() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return abandoned_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<int64_t, Result> results_;
    std::set<int64_t> abandoned_;
};

}  // namespace tg
