#pragma once

#include "cpq.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace warden {

// Bounded pool of threads draining a priority queue of job ids.
// The handler runs one job to completion; an exception it throws is logged
// and counted as a failed job, the worker keeps going.
class WorkerPool {
public:
    using Handler = std::function<void(const std::string& job_id)>;

    WorkerPool(int workers, Handler handler);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Lower priority value runs first. Returns false after shutdown.
    bool submit(const std::string& job_id, int32_t priority = 0);

    // Blocks until every submitted job has been handled.
    void drain();

    // Stops accepting work, finishes what is queued and joins the threads.
    void shutdown();

    int workers() const { return (int)threads_.size(); }
    uint64_t completed() const { return completed_.load(); }
    uint64_t failed() const { return failed_.load(); }

private:
    ConcurrentPriorityQueue<std::string> queue_;
    Handler handler_;
    std::vector<std::thread> threads_;

    std::mutex mu_;
    std::condition_variable idle_cv_;
    uint64_t pending_{0};
    bool joined_{false};

    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};

    void worker_loop(int wid);
};

} // namespace warden
