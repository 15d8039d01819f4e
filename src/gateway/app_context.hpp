#pragma once

#include <memory>

#include "config/config_schema.hpp"
#include "isolation/isolation_backend.hpp"
#include "isolation/kernel_backend.hpp"
#include "security/code_validator.hpp"
#include "service/execution_queue.hpp"
#include "service/execution_service.hpp"
#include "service/session_reaper.hpp"

namespace codebox::gateway {

// Everything a request handler needs, wired from one Config. Nothing starts
// until Startup() and everything stops in Shutdown().
class AppContext {
public:
    // Docker engine, kernel containers and ZeroMQ channels.
    explicit AppContext(config::Config config);
    // Caller-supplied backend; Startup() skips the image check.
    AppContext(config::Config config, std::shared_ptr<isolation::IsolationBackend> backend);
    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    // Throws IsolationStartupFailure when the kernel image is unavailable.
    void Startup();
    void Shutdown();

    const config::Config& Settings() const { return config_; }
    security::CodeValidator& Validator() { return validator_; }
    service::ExecutionService& Service() { return *service_; }
    service::ExecutionQueue& Queue() { return *queue_; }

private:
    config::Config config_;
    security::CodeValidator validator_;
    std::shared_ptr<isolation::KernelBackend> kernel_backend_;
    std::unique_ptr<service::ExecutionService> service_;
    std::unique_ptr<service::ExecutionQueue> queue_;
    std::unique_ptr<service::SessionReaper> reaper_;
    bool started_ = false;
};

}  // namespace codebox::gateway
