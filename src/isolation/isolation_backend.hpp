#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "kernel/kernel_channel.hpp"
#include "session/session_types.hpp"

namespace codebox::isolation {

// One running kernel container and the client side of its channel.
struct KernelHandle {
    std::string session_id;
    std::string container_id;
    std::filesystem::path kernel_file;
    std::filesystem::path client_file;
    std::unique_ptr<kernel::KernelChannel> channel;
};

class IsolationBackend {
public:
    virtual ~IsolationBackend() = default;

    // Returns a handle whose channel is ready. Throws IsolationStartupFailure
    // after removing whatever was created.
    virtual std::unique_ptr<KernelHandle> Create(const std::string& session_id,
                                                 const session::ResourceOptions& options) = 0;
    // Best effort; failures are logged, never thrown. The handle memory stays
    // valid so a concurrent reader only sees its channel fail.
    virtual void Destroy(KernelHandle& handle) = 0;
    virtual void Shutdown() = 0;
};

}  // namespace codebox::isolation
