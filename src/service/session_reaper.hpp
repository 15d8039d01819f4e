#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

namespace codebox::service {

class SessionReaper {
public:
    // Receives the idle threshold and returns how many sessions were reaped.
    using ReapHandler = std::function<std::size_t(std::chrono::seconds)>;

    SessionReaper(ReapHandler on_reap,
                  std::chrono::seconds interval = std::chrono::seconds(60),
                  std::chrono::seconds max_idle = std::chrono::seconds(0));
    ~SessionReaper();

    // No-op when max_idle is zero.
    void Start();
    void Stop();
    std::size_t TriggerNow();

    bool Enabled() const { return max_idle_.count() > 0; }

private:
    void RunLoop();

    ReapHandler on_reap_;
    std::chrono::seconds interval_;
    std::chrono::seconds max_idle_;
    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
};

}  // namespace codebox::service
