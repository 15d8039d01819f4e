#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace codebox::service {

// Fire-and-forget request ids drained by a fixed pool of workers.
class ExecutionQueue {
public:
    using Runner = std::function<void(const std::string&)>;

    ExecutionQueue(Runner runner, int workers = 4);
    ~ExecutionQueue();

    // No-op once closed.
    void Start();
    // Refuses further submissions and wakes idle workers. Returns the ids no
    // worker picked up; they will never run.
    std::vector<std::string> Close();
    // Waits for workers to finish the request each one is running.
    void Join();
    // Close() and Join(); dropped ids are only logged.
    void Stop();

    // False once the queue is closed.
    bool Submit(const std::string& request_id);
    std::size_t Pending() const;

private:
    void WorkerLoop();

    Runner runner_;
    int workers_count_;
    std::queue<std::string> pending_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    bool closed_ = false;
    std::vector<std::thread> workers_;
};

}  // namespace codebox::service
