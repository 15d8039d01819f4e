#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "kernel/kernel_channel.hpp"

namespace codebox::kernel {

struct ExchangeOutput {
    enum class Kind {
        kStream,
        kRendered
    };

    Kind kind = Kind::kStream;
    std::string stream_name;
    std::string text;
    // Present representations keyed by mime type.
    std::map<std::string, std::string> bundle;
};

struct KernelError {
    std::string ename;
    std::string evalue;
    std::vector<std::string> traceback;
};

enum class ExchangeEnd {
    kIdle,
    kKernelError,
    kTimeout,
    kChannelFailure
};

struct ExchangeResult {
    ExchangeEnd end = ExchangeEnd::kIdle;
    std::vector<ExchangeOutput> outputs;
    std::optional<KernelError> error;

    bool Completed() const { return end == ExchangeEnd::kIdle; }
};

// Submits `code` and collects iopub messages answering it until the kernel
// reports idle, sends an error, or sends nothing for this request within
// `per_message_timeout`. Traffic for other requests does not extend the wait.
// Never throws; channel problems end up in ExchangeResult::error.
ExchangeResult RunExchange(KernelChannel& channel,
                           const std::string& code,
                           std::chrono::milliseconds per_message_timeout);

}  // namespace codebox::kernel
