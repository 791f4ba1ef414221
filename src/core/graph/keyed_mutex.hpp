#pragma once

#include <condition_variable>
#include <mutex>
#include <set>
#include <string>

namespace polygraph::graph {

/**
 * KeyedMutex - One logical lock per key, created on demand.
 *
 * Only keys currently held are tracked, so the set never grows with the
 * number of nodes ever touched.
 */
class KeyedMutex {
public:
    class Guard {
    public:
        Guard(KeyedMutex& owner, std::string key)
            : owner_(&owner), key_(std::move(key)) {
            owner_->acquire(key_);
        }

        ~Guard() {
            if (owner_) owner_->release(key_);
        }

        Guard(Guard&& other) noexcept
            : owner_(other.owner_), key_(std::move(other.key_)) {
            other.owner_ = nullptr;
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;

    private:
        KeyedMutex* owner_;
        std::string key_;
    };

    Guard lock(const std::string& key) {
        return Guard(*this, key);
    }

    size_t held() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return held_.size();
    }

private:
    void acquire(const std::string& key) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return held_.count(key) == 0; });
        held_.insert(key);
    }

    void release(const std::string& key) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_.erase(key);
        }
        cv_.notify_all();
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::set<std::string> held_;
};

} // namespace polygraph::graph
