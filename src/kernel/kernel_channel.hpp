#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "kernel/connection_info.hpp"
#include "kernel/kernel_message.hpp"
#include "utils/errors.hpp"

namespace codebox::kernel {

class ChannelError : public Error {
public:
    using Error::Error;
};

class ChannelTimeout : public ChannelError {
public:
    using ChannelError::ChannelError;
};

// Client side of a running kernel: requests go out on shell, broadcast
// messages come back on iopub.
class KernelChannel {
public:
    virtual ~KernelChannel() = default;

    virtual void Start() = 0;
    // Throws ChannelTimeout when the kernel never answers kernel_info.
    virtual void WaitForReady(std::chrono::milliseconds timeout) = 0;
    // Sends an execute_request and returns its msg_id without waiting.
    virtual std::string Execute(const std::string& code) = 0;
    // Throws ChannelTimeout after `timeout` of silence, ChannelError once stopped.
    virtual KernelMessage NextIopubMessage(std::chrono::milliseconds timeout) = 0;
    // Safe to call from another thread while a read is blocked; idempotent.
    virtual void Stop() = 0;
};

using ChannelFactory = std::function<std::unique_ptr<KernelChannel>(const ConnectionInfo& info)>;

}  // namespace codebox::kernel
