#include "service/session_reaper.hpp"

#include <exception>
#include <string>

#include "utils/logging.hpp"

namespace codebox::service {

SessionReaper::SessionReaper(ReapHandler on_reap,
                             std::chrono::seconds interval,
                             std::chrono::seconds max_idle)
    : on_reap_(std::move(on_reap))
    , interval_(interval.count() > 0 ? interval : std::chrono::seconds(1))
    , max_idle_(max_idle) {}

SessionReaper::~SessionReaper() {
    Stop();
}

void SessionReaper::Start() {
    if (!Enabled() || running_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this]() { RunLoop(); });
    utils::LogInfo("service", "idle reaper every " + std::to_string(interval_.count()) + "s, max idle "
                   + std::to_string(max_idle_.count()) + "s");
}

void SessionReaper::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::size_t SessionReaper::TriggerNow() {
    if (!on_reap_) {
        return 0;
    }
    return on_reap_(max_idle_);
}

void SessionReaper::RunLoop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, interval_, [this] { return !running_; });
            if (!running_) {
                break;
            }
        }
        try {
            const auto reaped = TriggerNow();
            if (reaped > 0) {
                utils::LogInfo("service", "reaped " + std::to_string(reaped) + " idle sessions");
            }
        } catch (const std::exception& ex) {
            utils::LogError("service", std::string("idle sweep failed: ") + ex.what());
        }
    }
}

}  // namespace codebox::service
