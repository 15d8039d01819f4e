#include "gateway/app_context.hpp"

#include <chrono>

#include "isolation/docker_engine.hpp"
#include "kernel/zmq_kernel_channel.hpp"
#include "utils/logging.hpp"

namespace codebox::gateway {
namespace {

constexpr const char* kShutdownReason = "execution service shut down before the request ran";

}  // namespace

AppContext::AppContext(config::Config config)
    : config_(std::move(config))
    , validator_(security::CodeValidator::FromConfig(config_.validation)) {
    auto engine = std::make_shared<isolation::DockerEngine>(config_.isolation.docker_socket);
    kernel_backend_ = std::make_shared<isolation::KernelBackend>(
        config_.isolation, std::move(engine), kernel::ZmqKernelChannel::Factory());
    service_ = std::make_unique<service::ExecutionService>(kernel_backend_, config_.execution);
    queue_ = std::make_unique<service::ExecutionQueue>(
        [this](const std::string& request_id) { service_->ExecuteCode(request_id); },
        config_.execution.workers);
    reaper_ = std::make_unique<service::SessionReaper>(
        [this](std::chrono::seconds max_idle) { return service_->CleanupIdleSessions(max_idle); },
        std::chrono::seconds(config_.reaper.interval_s),
        std::chrono::seconds(config_.reaper.max_idle_s));
}

AppContext::AppContext(config::Config config, std::shared_ptr<isolation::IsolationBackend> backend)
    : config_(std::move(config))
    , validator_(security::CodeValidator::FromConfig(config_.validation))
    , service_(std::make_unique<service::ExecutionService>(std::move(backend), config_.execution)) {
    queue_ = std::make_unique<service::ExecutionQueue>(
        [this](const std::string& request_id) { service_->ExecuteCode(request_id); },
        config_.execution.workers);
    reaper_ = std::make_unique<service::SessionReaper>(
        [this](std::chrono::seconds max_idle) { return service_->CleanupIdleSessions(max_idle); },
        std::chrono::seconds(config_.reaper.interval_s),
        std::chrono::seconds(config_.reaper.max_idle_s));
}

AppContext::~AppContext() {
    Shutdown();
}

void AppContext::Startup() {
    if (started_) {
        return;
    }
    utils::LogConfig log_config;
    log_config.min_level = utils::ParseLogLevel(config_.logging.level);
    utils::ConfigureLogging(log_config);

    if (kernel_backend_) {
        kernel_backend_->EnsureImage();
    }
    queue_->Start();
    reaper_->Start();
    started_ = true;
    utils::LogInfo("gateway", "context started");
}

void AppContext::Shutdown() {
    reaper_->Stop();
    for (const auto& request_id : queue_->Close()) {
        service_->AbandonRequest(request_id, kShutdownReason);
    }
    // Tearing the sessions down stops their channels, which ends any exchange
    // a worker is still blocked in.
    service_->Shutdown();
    queue_->Join();
    if (started_) {
        started_ = false;
        utils::LogInfo("gateway", "context stopped");
    }
}

}  // namespace codebox::gateway
