#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "config/config_schema.hpp"
#include "isolation/container_engine.hpp"
#include "isolation/isolation_backend.hpp"
#include "kernel/kernel_channel.hpp"

namespace codebox::isolation {

inline constexpr const char* kContainerConnectionFile = "/opt/connection/kernel.json";
inline constexpr int kStartupLogLines = 10;

// Jupyter kernels in containers managed through a ContainerEngine.
class KernelBackend : public IsolationBackend {
public:
    KernelBackend(config::IsolationConfig config,
                  std::shared_ptr<ContainerEngine> engine,
                  kernel::ChannelFactory channel_factory);

    // Builds the configured image when the engine does not have it.
    void EnsureImage();

    std::unique_ptr<KernelHandle> Create(const std::string& session_id,
                                         const session::ResourceOptions& options) override;
    void Destroy(KernelHandle& handle) override;
    void Shutdown() override;

    ContainerSpec BuildSpec(const std::string& session_id,
                            const session::ResourceOptions& options,
                            const std::filesystem::path& kernel_file,
                            const std::vector<int>& ports) const;

    std::filesystem::path ConnectionDir();

private:
    // Status reached after the bounded startup poll.
    std::string AwaitRunning(const std::string& container_id);
    void AbortStartup(KernelHandle& handle, const std::string& status);

    config::IsolationConfig config_;
    std::shared_ptr<ContainerEngine> engine_;
    kernel::ChannelFactory channel_factory_;
    std::filesystem::path connection_dir_;
    bool owns_connection_dir_ = false;
    std::mutex dir_mutex_;
};

}  // namespace codebox::isolation
