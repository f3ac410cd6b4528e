#include "warden/worker_pool.h"
#include "warden/errors.h"

#include <iostream>

namespace warden {

WorkerPool::WorkerPool(int workers, Handler handler) : handler_(std::move(handler)) {
    if (workers <= 0) throw Error(ErrorKind::VALIDATION, "worker pool needs at least one worker");
    if (!handler_) throw Error(ErrorKind::VALIDATION, "worker pool needs a handler");
    threads_.reserve((size_t)workers);
    for (int wid = 0; wid < workers; wid++) {
        threads_.emplace_back([this, wid]() { worker_loop(wid); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(const std::string& job_id, int32_t priority) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        pending_++;
    }
    if (queue_.push(priority, job_id)) return true;

    std::lock_guard<std::mutex> lk(mu_);
    pending_--;
    idle_cv_.notify_all();
    return false;
}

void WorkerPool::worker_loop(int wid) {
    ConcurrentPriorityQueue<std::string>::Item qi;
    while (queue_.pop(qi)) {
        try {
            handler_(qi.value);
            completed_++;
        } catch (const std::exception& e) {
            failed_++;
            std::cerr << "[warden] worker " << wid << " job " << qi.value << ": " << e.what() << "\n";
        }
        std::lock_guard<std::mutex> lk(mu_);
        pending_--;
        if (pending_ == 0) idle_cv_.notify_all();
    }
}

void WorkerPool::drain() {
    std::unique_lock<std::mutex> lk(mu_);
    idle_cv_.wait(lk, [&]{ return pending_ == 0; });
}

void WorkerPool::shutdown() {
    queue_.shutdown();
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (joined_) return;
        joined_ = true;
    }
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

} // namespace warden
