#include "test_common.h"

#include "warden/cpq.h"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using warden::ConcurrentPriorityQueue;

int main() {
    ConcurrentPriorityQueue<std::string> q;

    expect_true(q.push(5, "retry-2"), "push accepted");
    q.push(0, "job-a");
    q.push(0, "job-b");
    q.push(1, "retry-1");
    expect_eq_ll((long long)q.size(), 4, "size counts queued jobs");

    ConcurrentPriorityQueue<std::string>::Item it;
    std::vector<std::string> order;
    while (q.try_pop(it)) order.push_back(it.value);
    expect_true(order == std::vector<std::string>({"job-a", "job-b", "retry-1", "retry-2"}),
                "lower priority first, FIFO within a priority");
    expect_true(!q.try_pop(it), "try_pop on empty queue");

    // Blocking pop unblocks on shutdown.
    ConcurrentPriorityQueue<int> q2;
    bool popped = true;
    std::thread t([&] {
        ConcurrentPriorityQueue<int>::Item it2;
        popped = q2.pop(it2);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    q2.shutdown();
    t.join();
    expect_true(!popped, "pop returns false after shutdown on empty queue");

    // Queued items survive shutdown; new ones are refused.
    ConcurrentPriorityQueue<int> q3;
    q3.push(0, 7);
    q3.shutdown();
    expect_true(!q3.push(0, 8), "push after shutdown refused");
    ConcurrentPriorityQueue<int>::Item it3;
    expect_true(q3.pop(it3) && it3.value == 7, "queued item still handed out");
    expect_true(!q3.pop(it3), "then the queue reports closed");

    // Producer/consumer across threads: nothing lost.
    ConcurrentPriorityQueue<int> q4;
    long long sum = 0;
    std::thread consumer([&] {
        ConcurrentPriorityQueue<int>::Item x;
        while (q4.pop(x)) sum += x.value;
    });
    for (int i = 1; i <= 1000; i++) q4.push(i % 3, i);
    q4.shutdown();
    consumer.join();
    expect_eq_ll(sum, 1000LL * 1001 / 2, "every item consumed once");

    std::cerr << "test_cpq: ALL PASSED" << std::endl;
    return 0;
}
