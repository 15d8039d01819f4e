#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "isolation/container_engine.hpp"
#include "isolation/isolation_backend.hpp"
#include "kernel/kernel_channel.hpp"
#include "utils/errors.hpp"

namespace codebox::testing {

inline kernel::KernelMessage IopubMessage(const std::string& msg_type,
                                          const std::string& parent_id,
                                          nlohmann::json content) {
    kernel::KernelMessage message;
    message.header = {{"msg_type", msg_type}, {"msg_id", "iopub-" + msg_type}};
    message.parent_header = {{"msg_id", parent_id}};
    message.content = std::move(content);
    return message;
}

inline kernel::KernelMessage StreamMessage(const std::string& parent_id, const std::string& text,
                                           const std::string& name = "stdout") {
    return IopubMessage("stream", parent_id, {{"name", name}, {"text", text}});
}

inline kernel::KernelMessage IdleMessage(const std::string& parent_id) {
    return IopubMessage("status", parent_id, {{"execution_state", "idle"}});
}

inline kernel::KernelMessage ErrorMessage(const std::string& parent_id, const std::string& ename,
                                          const std::string& evalue) {
    nlohmann::json content = {{"ename", ename}, {"evalue", evalue}};
    content["traceback"] = nlohmann::json::array({ename + ": " + evalue});
    return IopubMessage("error", parent_id, std::move(content));
}

// Replies to each Execute() with whatever the script returns for that code.
// An empty iopub queue reads as a timeout.
class FakeKernelChannel : public kernel::KernelChannel {
public:
    using Script = std::function<std::vector<kernel::KernelMessage>(const std::string& code,
                                                                    const std::string& msg_id)>;

    // Produces a message whenever the scripted queue is empty, instead of a
    // timeout. Receives the msg_id of the latest execute_request.
    using Filler = std::function<kernel::KernelMessage(const std::string& last_msg_id)>;

    explicit FakeKernelChannel(Script script = {})
        : script_(std::move(script)) {}

    void Start() override { started_ = true; }

    void WaitForReady(std::chrono::milliseconds) override {
        if (fail_ready_) {
            throw kernel::ChannelTimeout("kernel did not answer kernel_info_request");
        }
    }

    std::string Execute(const std::string& code) override {
        if (stopped_) {
            throw kernel::ChannelError("channel stopped");
        }
        if (in_flight_.exchange(true)) {
            overlapped_ = true;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        const auto msg_id = "exec-" + std::to_string(++executions_);
        last_msg_id_ = msg_id;
        codes_.push_back(code);
        if (script_) {
            for (auto& message : script_(code, msg_id)) {
                queue_.push_back(std::move(message));
            }
        }
        return msg_id;
    }

    kernel::KernelMessage NextIopubMessage(std::chrono::milliseconds timeout) override {
        if (read_delay_.count() > 0) {
            std::this_thread::sleep_for(read_delay_);
        }
        if (stopped_) {
            in_flight_ = false;
            throw kernel::ChannelError("channel stopped");
        }
        std::unique_lock<std::mutex> lock(mutex_);
        read_timeouts_.push_back(timeout);
        if (queue_.empty() && filler_) {
            const auto filler = filler_;
            const auto msg_id = last_msg_id_;
            lock.unlock();
            std::this_thread::sleep_for(std::min(timeout, kFillerInterval));
            if (stopped_) {
                in_flight_ = false;
                throw kernel::ChannelError("channel stopped");
            }
            return filler(msg_id);
        }
        if (queue_.empty()) {
            in_flight_ = false;
            throw kernel::ChannelTimeout("no kernel message within the timeout");
        }
        auto message = std::move(queue_.front());
        queue_.pop_front();
        ++reads_;
        if (queue_.empty()) {
            in_flight_ = false;
        }
        return message;
    }

    void Stop() override {
        ++stop_calls_;
        stopped_ = true;
    }

    void SetFailReady(bool fail) { fail_ready_ = fail; }
    void SetReadDelay(std::chrono::milliseconds delay) { read_delay_ = delay; }
    void SetFiller(Filler filler) {
        std::lock_guard<std::mutex> lock(mutex_);
        filler_ = std::move(filler);
    }

    bool Started() const { return started_; }
    bool Overlapped() const { return overlapped_; }
    int StopCalls() const { return stop_calls_; }
    int Reads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reads_;
    }
    std::vector<std::string> Codes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return codes_;
    }
    std::vector<std::chrono::milliseconds> ReadTimeouts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return read_timeouts_;
    }

private:
    static constexpr std::chrono::milliseconds kFillerInterval{10};

    Script script_;
    Filler filler_;
    std::string last_msg_id_;
    std::vector<std::chrono::milliseconds> read_timeouts_;
    mutable std::mutex mutex_;
    std::deque<kernel::KernelMessage> queue_;
    std::vector<std::string> codes_;
    int executions_ = 0;
    int reads_ = 0;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> in_flight_{false};
    std::atomic<bool> overlapped_{false};
    std::atomic<bool> fail_ready_{false};
    std::atomic<int> stop_calls_{0};
    std::chrono::milliseconds read_delay_{0};
};

// Echoes the submitted code on stdout and finishes idle.
inline FakeKernelChannel::Script EchoScript() {
    return [](const std::string& code, const std::string& msg_id) {
        return std::vector<kernel::KernelMessage>{StreamMessage(msg_id, code), IdleMessage(msg_id)};
    };
}

// Records every call; statuses are served in order and the last one repeats.
class FakeContainerEngine : public isolation::ContainerEngine {
public:
    bool ImageExists(const std::string& image) override {
        Record("image_exists " + image);
        return image_exists;
    }

    void BuildImage(const std::string& image, const std::string& dockerfile, const std::string& context) override {
        Record("build " + image + " " + dockerfile + " " + context);
        if (fail_build) {
            throw isolation::EngineError("build failed");
        }
    }

    std::string CreateContainer(const isolation::ContainerSpec& spec) override {
        Record("create " + spec.name);
        specs.push_back(spec);
        if (fail_create) {
            throw isolation::EngineError("create failed");
        }
        return "container-" + std::to_string(specs.size());
    }

    void StartContainer(const std::string& id) override { Record("start " + id); }

    std::string ContainerStatus(const std::string& id) override {
        Record("status " + id);
        if (statuses.empty()) {
            return "running";
        }
        auto status = statuses.front();
        if (statuses.size() > 1) {
            statuses.pop_front();
        }
        return status;
    }

    std::string ContainerLogs(const std::string& id, int tail) override {
        Record("logs " + id + " " + std::to_string(tail));
        return "Traceback: kernel crashed";
    }

    void StopContainer(const std::string& id, int) override {
        Record("stop " + id);
        if (fail_teardown) {
            throw isolation::EngineError("stop failed");
        }
    }

    void RemoveContainer(const std::string& id, bool) override {
        Record("remove " + id);
        if (fail_teardown) {
            throw isolation::EngineError("remove failed");
        }
    }

    int Count(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int count = 0;
        for (const auto& call : calls) {
            if (call.compare(0, prefix.size(), prefix) == 0) {
                ++count;
            }
        }
        return count;
    }

    bool image_exists = true;
    bool fail_build = false;
    bool fail_create = false;
    bool fail_teardown = false;
    std::deque<std::string> statuses;
    std::vector<isolation::ContainerSpec> specs;
    std::vector<std::string> calls;

private:
    void Record(const std::string& call) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls.push_back(call);
    }

    mutable std::mutex mutex_;
};

// Hands out FakeKernelChannels and counts lifecycle calls.
class FakeIsolationBackend : public isolation::IsolationBackend {
public:
    explicit FakeIsolationBackend(FakeKernelChannel::Script script = EchoScript())
        : script_(std::move(script)) {}

    std::unique_ptr<isolation::KernelHandle> Create(const std::string& session_id,
                                                    const session::ResourceOptions& options) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++creates_;
        last_options_ = options;
        if (fail_create_) {
            throw IsolationStartupFailure("Kernel container failed to start: exited");
        }
        auto handle = std::make_unique<isolation::KernelHandle>();
        handle->session_id = session_id;
        handle->container_id = "container-" + session_id;
        auto channel = std::make_unique<FakeKernelChannel>(script_);
        channel->SetReadDelay(read_delay_);
        if (filler_) {
            channel->SetFiller(filler_);
        }
        channels_[session_id] = channel.get();
        handle->channel = std::move(channel);
        return handle;
    }

    void Destroy(isolation::KernelHandle& handle) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++destroys_;
        destroyed_.push_back(handle.session_id);
        if (handle.channel) {
            handle.channel->Stop();
        }
    }

    void Shutdown() override { ++shutdowns_; }

    void SetFailCreate(bool fail) { fail_create_ = fail; }
    void SetReadDelay(std::chrono::milliseconds delay) { read_delay_ = delay; }
    // Applies to channels handed out afterwards.
    void SetFiller(FakeKernelChannel::Filler filler) {
        std::lock_guard<std::mutex> lock(mutex_);
        filler_ = std::move(filler);
    }

    int Creates() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return creates_;
    }
    int Destroys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return destroys_;
    }
    int Shutdowns() const { return shutdowns_; }
    std::vector<std::string> Destroyed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return destroyed_;
    }
    session::ResourceOptions LastOptions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_options_;
    }
    // Owned by the session's handle; valid until the service drops it.
    FakeKernelChannel* Channel(const std::string& session_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(session_id);
        return it == channels_.end() ? nullptr : it->second;
    }

private:
    FakeKernelChannel::Script script_;
    mutable std::mutex mutex_;
    int creates_ = 0;
    int destroys_ = 0;
    std::atomic<int> shutdowns_{0};
    bool fail_create_ = false;
    std::chrono::milliseconds read_delay_{0};
    FakeKernelChannel::Filler filler_;
    session::ResourceOptions last_options_;
    std::vector<std::string> destroyed_;
    std::map<std::string, FakeKernelChannel*> channels_;
};

}  // namespace codebox::testing
