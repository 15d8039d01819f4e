#include "isolation/kernel_backend.hpp"

#include <chrono>
#include <functional>
#include <system_error>
#include <thread>

#include "kernel/connection_info.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace codebox::isolation {
namespace {

constexpr const char* kKernelPythonPath = "/opt/kernel";

struct TeardownStep {
    const char* name;
    std::function<void()> action;
};

void RemoveFile(const std::filesystem::path& path) {
    if (!path.empty()) {
        std::filesystem::remove(path);
    }
}

void RemoveFileQuietly(const std::filesystem::path& path) {
    std::error_code ec;
    if (!path.empty()) {
        std::filesystem::remove(path, ec);
    }
    if (ec) {
        utils::LogWarn("isolation", "could not delete " + path.string() + ": " + ec.message());
    }
}

}  // namespace

KernelBackend::KernelBackend(config::IsolationConfig config,
                             std::shared_ptr<ContainerEngine> engine,
                             kernel::ChannelFactory channel_factory)
    : config_(std::move(config))
    , engine_(std::move(engine))
    , channel_factory_(std::move(channel_factory)) {}

void KernelBackend::EnsureImage() {
    try {
        if (engine_->ImageExists(config_.image)) {
            return;
        }
        if (config_.build_context.empty()) {
            throw IsolationStartupFailure("Image " + config_.image + " not found and no build context configured");
        }
        std::filesystem::path dockerfile(config_.dockerfile);
        if (dockerfile.is_relative()) {
            dockerfile = std::filesystem::path(config_.build_context) / dockerfile;
        }
        engine_->BuildImage(config_.image, dockerfile.string(), config_.build_context);
    } catch (const EngineError& ex) {
        throw IsolationStartupFailure(std::string("Kernel image unavailable: ") + ex.what());
    }
}

std::filesystem::path KernelBackend::ConnectionDir() {
    std::lock_guard<std::mutex> lock(dir_mutex_);
    if (connection_dir_.empty()) {
        if (config_.connection_dir.empty()) {
            connection_dir_ = std::filesystem::temp_directory_path() / ("codebox-" + utils::GenerateUuid());
            owns_connection_dir_ = true;
        } else {
            connection_dir_ = config_.connection_dir;
        }
    }
    std::error_code ec;
    std::filesystem::create_directories(connection_dir_, ec);
    if (ec) {
        throw IsolationStartupFailure("cannot create connection directory " + connection_dir_.string()
                                      + ": " + ec.message());
    }
    if (owns_connection_dir_) {
        std::filesystem::permissions(connection_dir_, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace, ec);
    }
    return connection_dir_;
}

ContainerSpec KernelBackend::BuildSpec(const std::string& session_id,
                                       const session::ResourceOptions& options,
                                       const std::filesystem::path& kernel_file,
                                       const std::vector<int>& ports) const {
    ContainerSpec spec;
    spec.name = "codebox-" + session_id;
    spec.image = config_.image;
    spec.command = {"python", "-m", "ipykernel_launcher", "-f", kContainerConnectionFile};
    spec.environment = options.environment;
    spec.environment["PYTHONPATH"] = kKernelPythonPath;
    spec.mounts.push_back(BindMount{kernel_file.string(), kContainerConnectionFile, true});
    for (const auto& mount : options.mount_points) {
        std::error_code ec;
        auto host = std::filesystem::weakly_canonical(std::filesystem::absolute(mount.host_path), ec);
        if (ec) {
            host = mount.host_path;
        }
        spec.mounts.push_back(BindMount{host.string(), mount.container_path, mount.read_only});
    }
    spec.ports = ports;
    spec.memory_bytes = session::ParseMemoryLimit(options.memory_limit);
    spec.nano_cpus = session::ParseNanoCpus(options.cpu_limit);
    spec.pids_limit = config_.pids_limit;
    spec.network_mode = config_.network_mode;
    spec.dns = config_.dns;
    return spec;
}

std::unique_ptr<KernelHandle> KernelBackend::Create(const std::string& session_id,
                                                    const session::ResourceOptions& options) {
    auto handle = std::make_unique<KernelHandle>();
    handle->session_id = session_id;

    kernel::ConnectionInfo client_info;
    try {
        const auto dir = ConnectionDir();
        client_info = kernel::NewConnectionInfo();
        auto kernel_info = client_info;
        kernel_info.ip = "0.0.0.0";
        handle->kernel_file = dir / ("kernel-" + session_id + ".json");
        handle->client_file = dir / ("client-" + session_id + ".json");
        kernel::WriteConnectionFile(handle->kernel_file, kernel_info);
        kernel::WriteConnectionFile(handle->client_file, client_info);
    } catch (const IsolationStartupFailure&) {
        throw;
    } catch (const std::exception& ex) {
        RemoveFileQuietly(handle->kernel_file);
        RemoveFileQuietly(handle->client_file);
        throw IsolationStartupFailure(std::string("cannot prepare kernel connection: ") + ex.what());
    }

    try {
        const auto spec = BuildSpec(session_id, options, handle->kernel_file, client_info.Ports());
        handle->container_id = engine_->CreateContainer(spec);
        utils::LogInfo("isolation", "created container " + handle->container_id + " for session " + session_id);
        engine_->StartContainer(handle->container_id);
    } catch (const std::exception& ex) {
        utils::LogError("isolation", "session " + session_id + ": " + ex.what());
        AbortStartup(*handle, "not started");
        throw IsolationStartupFailure("Kernel container failed to start: not started");
    }

    const auto status = AwaitRunning(handle->container_id);
    if (status != "running") {
        AbortStartup(*handle, status);
        throw IsolationStartupFailure("Kernel container failed to start: " + status);
    }

    try {
        handle->channel = channel_factory_(client_info);
        handle->channel->Start();
        handle->channel->WaitForReady(std::chrono::seconds(config_.ready_timeout_s));
    } catch (const std::exception& ex) {
        utils::LogError("isolation", "kernel for session " + session_id + " not ready: " + ex.what());
        Destroy(*handle);
        throw IsolationStartupFailure(std::string("Kernel did not become ready: ") + ex.what());
    }

    utils::LogInfo("isolation", "kernel ready for session " + session_id);
    return handle;
}

std::string KernelBackend::AwaitRunning(const std::string& container_id) {
    std::string status = "unknown";
    for (int attempt = 1; attempt <= config_.startup_attempts; ++attempt) {
        try {
            status = engine_->ContainerStatus(container_id);
        } catch (const EngineError& ex) {
            utils::LogWarn("isolation", std::string("status check failed: ") + ex.what());
            status = "unknown";
        }
        if (status == "running") {
            return status;
        }
        if (attempt < config_.startup_attempts) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.startup_interval_ms));
        }
    }
    return status;
}

void KernelBackend::AbortStartup(KernelHandle& handle, const std::string& status) {
    if (!handle.container_id.empty()) {
        try {
            const auto logs = engine_->ContainerLogs(handle.container_id, kStartupLogLines);
            utils::LogError("isolation", "container " + handle.container_id + " is " + status
                            + ", last log lines:\n" + logs);
        } catch (const EngineError& ex) {
            utils::LogWarn("isolation", std::string("could not read container logs: ") + ex.what());
        }
        try {
            engine_->RemoveContainer(handle.container_id, true);
        } catch (const EngineError& ex) {
            utils::LogWarn("isolation", std::string("could not remove container: ") + ex.what());
        }
    }
    RemoveFileQuietly(handle.kernel_file);
    RemoveFileQuietly(handle.client_file);
}

void KernelBackend::Destroy(KernelHandle& handle) {
    const auto& container_id = handle.container_id;
    const std::vector<TeardownStep> steps = {
        {"stop channel", [&] {
            if (handle.channel) {
                handle.channel->Stop();
            }
        }},
        {"stop container", [&] {
            if (!container_id.empty()) {
                engine_->StopContainer(container_id, config_.stop_grace_s);
            }
        }},
        {"remove container", [&] {
            if (!container_id.empty()) {
                engine_->RemoveContainer(container_id, true);
            }
        }},
        {"delete kernel descriptor", [&] { RemoveFile(handle.kernel_file); }},
        {"delete client descriptor", [&] { RemoveFile(handle.client_file); }},
    };

    std::vector<std::string> errors;
    for (const auto& step : steps) {
        try {
            step.action();
        } catch (const std::exception& ex) {
            errors.push_back(std::string(step.name) + ": " + ex.what());
        }
    }

    if (errors.empty()) {
        utils::LogInfo("isolation", "session " + handle.session_id + " torn down");
    } else {
        utils::LogWarn("isolation", "teardown of session " + handle.session_id + " incomplete: "
                       + utils::Join(errors, "; "));
    }
}

void KernelBackend::Shutdown() {
    std::lock_guard<std::mutex> lock(dir_mutex_);
    if (!owns_connection_dir_ || connection_dir_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(connection_dir_, ec);
    if (ec) {
        utils::LogWarn("isolation", "could not remove " + connection_dir_.string() + ": " + ec.message());
    }
    connection_dir_.clear();
    owns_connection_dir_ = false;
}

}  // namespace codebox::isolation
