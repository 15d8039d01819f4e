#include "service/execution_queue.hpp"

#include <exception>

#include "utils/logging.hpp"

namespace codebox::service {

ExecutionQueue::ExecutionQueue(Runner runner, int workers)
    : runner_(std::move(runner))
    , workers_count_(workers > 0 ? workers : 1) {}

ExecutionQueue::~ExecutionQueue() {
    Stop();
}

void ExecutionQueue::Start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || running_.exchange(true)) {
            return;
        }
    }
    for (int i = 0; i < workers_count_; ++i) {
        workers_.emplace_back([this]() { WorkerLoop(); });
    }
    utils::LogInfo("service", "execution queue started with " + std::to_string(workers_count_) + " workers");
}

std::vector<std::string> ExecutionQueue::Close() {
    std::vector<std::string> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        running_ = false;
        while (!pending_.empty()) {
            dropped.push_back(std::move(pending_.front()));
            pending_.pop();
        }
    }
    cv_.notify_all();
    return dropped;
}

void ExecutionQueue::Join() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void ExecutionQueue::Stop() {
    const auto dropped = Close();
    if (!dropped.empty()) {
        utils::LogWarn("service", "dropping " + std::to_string(dropped.size()) + " queued requests");
    }
    Join();
}

bool ExecutionQueue::Submit(const std::string& request_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        pending_.push(request_id);
    }
    cv_.notify_one();
    return true;
}

std::size_t ExecutionQueue::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void ExecutionQueue::WorkerLoop() {
    while (true) {
        std::string request_id;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !running_ || !pending_.empty(); });
            if (!running_) {
                return;
            }
            request_id = std::move(pending_.front());
            pending_.pop();
        }
        try {
            runner_(request_id);
        } catch (const std::exception& ex) {
            utils::LogError("service", "request " + request_id + " escaped the runner: " + ex.what());
        }
    }
}

}  // namespace codebox::service
