#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <utility>
#include <vector>

namespace warden {

// ConcurrentPriorityQueue
// - Thread-safe push/pop, lower priority value pops first, FIFO within a priority
// - Blocking pop; shutdown() wakes every waiter
// - After shutdown, pop() still hands out what is queued, then returns false
template <typename T>
class ConcurrentPriorityQueue {
public:
    struct Item {
        int32_t priority{0};
        uint64_t seq{0};
        T value;
    };

private:
    struct Cmp {
        bool operator()(const Item& a, const Item& b) const {
            // std::priority_queue pops the "largest"; invert so lower priority comes first.
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.seq > b.seq;
        }
    };

public:
    // Returns false if the queue has been shut down.
    bool push(int32_t priority, T value) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return false;
        q_.push(Item{priority, seq_++, std::move(value)});
        cv_.notify_one();
        return true;
    }

    // Blocks until an item is available. Returns false when shut down and empty.
    bool pop(Item& out) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&]{ return closed_ || !q_.empty(); });
        if (q_.empty()) return false;
        out = q_.top();
        q_.pop();
        return true;
    }

    bool try_pop(Item& out) {
        std::lock_guard<std::mutex> lk(mu_);
        if (q_.empty()) return false;
        out = q_.top();
        q_.pop();
        return true;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::priority_queue<Item, std::vector<Item>, Cmp> q_;
    uint64_t seq_{0};
    bool closed_{false};
};

} // namespace warden
