#include "test_common.h"

#include "warden/worker_pool.h"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace warden;

int main() {
    // Every submitted job runs once, bounded by the worker count.
    {
        std::atomic<int> running{0};
        std::atomic<int> peak{0};
        std::atomic<int> handled{0};
        WorkerPool pool(3, [&](const std::string&) {
            int now = ++running;
            int p = peak.load();
            while (now > p && !peak.compare_exchange_weak(p, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --running;
            ++handled;
        });
        expect_eq_ll(pool.workers(), 3, "worker count");
        for (int i = 0; i < 30; i++) {
            expect_true(pool.submit("job-" + std::to_string(i)), "submit accepted");
        }
        pool.drain();
        expect_eq_ll(handled.load(), 30, "all jobs handled");
        expect_eq_ll((long long)pool.completed(), 30, "completed count");
        expect_true(peak.load() <= 3, "never more than three at once");
        pool.shutdown();
        expect_true(!pool.submit("late"), "submit after shutdown refused");
    }

    // A throwing handler counts as failed and does not stop the worker.
    {
        WorkerPool pool(1, [](const std::string& id) {
            if (id == "bad") throw std::runtime_error("dataset missing");
        });
        pool.submit("good-1");
        pool.submit("bad");
        pool.submit("good-2");
        pool.drain();
        expect_eq_ll((long long)pool.completed(), 2, "good jobs completed");
        expect_eq_ll((long long)pool.failed(), 1, "bad job failed");
    }

    // With one worker, queued jobs run lowest priority value first.
    {
        std::promise<void> release;
        std::shared_future<void> gate = release.get_future().share();
        std::mutex mu;
        std::vector<std::string> order;
        WorkerPool pool(1, [&](const std::string& id) {
            if (id == "blocker") {
                gate.wait();
                return;
            }
            std::lock_guard<std::mutex> lk(mu);
            order.push_back(id);
        });
        pool.submit("blocker", 0);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        pool.submit("retry-2", 2);
        pool.submit("fresh-a", 0);
        pool.submit("retry-1", 1);
        pool.submit("fresh-b", 0);
        release.set_value();
        pool.drain();
        expect_true(order == std::vector<std::string>({"fresh-a", "fresh-b", "retry-1", "retry-2"}),
                    "priority then submission order");
    }

    // Drain on an idle pool returns at once.
    {
        WorkerPool pool(2, [](const std::string&) {});
        pool.drain();
        expect_eq_ll((long long)pool.completed(), 0, "nothing ran");
    }

    expect_throws_kind(ErrorKind::VALIDATION, [] { WorkerPool p(0, [](const std::string&) {}); }, "zero workers");
    expect_throws_kind(ErrorKind::VALIDATION, [] { WorkerPool p(1, WorkerPool::Handler{}); }, "missing handler");

    std::cerr << "test_worker_pool: ALL PASSED" << std::endl;
    return 0;
}
