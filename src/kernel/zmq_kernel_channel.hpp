#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <zmq.hpp>

#include "kernel/kernel_channel.hpp"

namespace codebox::kernel {

class ZmqKernelChannel : public KernelChannel {
public:
    explicit ZmqKernelChannel(ConnectionInfo info);
    ~ZmqKernelChannel() override;

    void Start() override;
    void WaitForReady(std::chrono::milliseconds timeout) override;
    std::string Execute(const std::string& code) override;
    KernelMessage NextIopubMessage(std::chrono::milliseconds timeout) override;
    void Stop() override;

    static ChannelFactory Factory();

private:
    void Send(zmq::socket_t& socket, const KernelMessage& message);
    // Frames of one multipart message, or empty when nothing arrived in `wait`.
    std::vector<std::string> Receive(zmq::socket_t& socket, std::chrono::milliseconds wait);
    void Drain(zmq::socket_t& socket);
    void EnsureRunning() const;

    ConnectionInfo info_;
    MessageCodec codec_;
    zmq::context_t context_;
    std::unique_ptr<zmq::socket_t> shell_;
    std::unique_ptr<zmq::socket_t> iopub_;
    std::mutex socket_mutex_;
    std::atomic<bool> stopped_{false};
};

}  // namespace codebox::kernel
