#include "service/execution_service.hpp"

#include "security/package_policy.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace codebox::service {
namespace {

std::string NotFoundMessage(const std::string& session_id) {
    return "Session " + session_id + " not found, must create a session first";
}

// Dependencies are plain requirements by now; quoting keeps '<' and '>' away
// from the shell.
std::string InstallCommand(const std::vector<std::string>& dependencies) {
    std::string command = "!pip install";
    for (const auto& dependency : dependencies) {
        command += " '" + dependency + "'";
    }
    return command;
}

session::ExecutionStatus StatusFor(kernel::ExchangeEnd end) {
    switch (end) {
        case kernel::ExchangeEnd::kIdle: return session::ExecutionStatus::kCompleted;
        case kernel::ExchangeEnd::kKernelError: return session::ExecutionStatus::kFailed;
        case kernel::ExchangeEnd::kTimeout:
        case kernel::ExchangeEnd::kChannelFailure: return session::ExecutionStatus::kError;
    }
    return session::ExecutionStatus::kError;
}

}  // namespace

session::Result TranslateExchange(const kernel::ExchangeResult& exchange) {
    session::Result result;
    result.status = StatusFor(exchange.end);
    for (const auto& output : exchange.outputs) {
        if (output.kind == kernel::ExchangeOutput::Kind::kStream) {
            result.outputs.push_back(session::Output{"stream", output.text, output.stream_name, ""});
            continue;
        }
        const auto png = output.bundle.find("image/png");
        if (png != output.bundle.end()) {
            result.files.push_back(session::FilePayload{"image/png", png->second});
        }
        const auto text = output.bundle.find("text/plain");
        if (text != output.bundle.end()) {
            result.outputs.push_back(session::Output{"result", text->second, "", "text/plain"});
        }
    }
    if (exchange.error) {
        result.error = session::ExecutionError{exchange.error->ename, exchange.error->evalue, exchange.error->traceback};
    }
    return result;
}

ExecutionService::ExecutionService(std::shared_ptr<isolation::IsolationBackend> backend,
                                   config::ExecutionDefaults defaults)
    : backend_(std::move(backend))
    , defaults_(std::move(defaults)) {}

ExecutionService::~ExecutionService() {
    Shutdown();
}

std::string ExecutionService::CreateSession(const std::vector<std::string>& dependencies,
                                            const session::ResourceOptions& options) {
    if (shut_down_) {
        throw IsolationStartupFailure("execution service is shut down");
    }
    session::ValidateResourceOptions(options);
    for (const auto& dependency : dependencies) {
        if (auto error = security::RequirementSyntaxError(dependency)) {
            throw ValidationRejected(*error);
        }
    }

    const auto session_id = utils::GenerateUuid();
    utils::LogInfo("service", "creating session " + session_id);
    auto handle = backend_->Create(session_id, options);
    auto& raw_handle = *handle;

    std::shared_ptr<session::SessionEntry> entry;
    try {
        entry = std::make_shared<session::SessionEntry>(session_id, dependencies, options, std::move(handle));
        if (!dependencies.empty()) {
            const auto install = entry->Exchange(InstallCommand(dependencies));
            if (!install.Completed()) {
                const auto detail = install.error ? install.error->ename + ": " + install.error->evalue
                                                  : std::string("unknown error");
                throw DependencyInstallFailure("Failed to install dependencies: " + detail);
            }
            utils::LogInfo("service", "installed " + utils::Join(dependencies, " ") + " in session " + session_id);
        }
    } catch (const std::exception& ex) {
        utils::LogError("service", "session " + session_id + " rolled back: " + ex.what());
        backend_->Destroy(raw_handle);
        throw;
    }

    registry_.Insert(entry);
    if (shut_down_) {
        CleanupSession(session_id);
        throw IsolationStartupFailure("execution service is shut down");
    }
    utils::LogInfo("service", "session " + session_id + " ready");
    return session_id;
}

std::string ExecutionService::CreateExecutionRequest(const std::string& code,
                                                     const std::string& session_id,
                                                     const std::vector<std::string>& disabled_rules) {
    if (session_id.empty() || !registry_.Find(session_id)) {
        throw SessionNotFound(NotFoundMessage(session_id));
    }
    if (code.size() > defaults_.max_code_length) {
        throw ValidationRejected("Code exceeds maximum length of " + std::to_string(defaults_.max_code_length)
                                 + " characters");
    }

    ExecutionRequest request;
    request.id = utils::GenerateUuid();
    request.session_id = session_id;
    request.code = code;
    request.disabled_rules = disabled_rules;
    request.created_at = utils::Now();

    const auto id = request.id;
    std::lock_guard<std::mutex> lock(requests_mutex_);
    requests_.emplace(id, std::move(request));
    return id;
}

void ExecutionService::ExecuteCode(const std::string& request_id) {
    ExecutionRequest request;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        auto it = requests_.find(request_id);
        if (it == requests_.end()) {
            utils::LogWarn("service", "unknown request " + request_id);
            return;
        }
        if (it->second.status != session::ExecutionStatus::kInitializing) {
            utils::LogWarn("service", "request " + request_id + " already " + session::ToString(it->second.status));
            return;
        }
        it->second.status = session::ExecutionStatus::kRunning;
        request = it->second;
    }

    utils::LogInfo("service", "executing request " + request_id + " in session " + request.session_id);
    session::Result result;
    try {
        auto entry = registry_.Find(request.session_id);
        if (!entry) {
            throw SessionNotFound(NotFoundMessage(request.session_id));
        }
        result = TranslateExchange(entry->Exchange(request.code));
    } catch (const std::exception& ex) {
        utils::LogError("service", "request " + request_id + " failed: " + ex.what());
        result = session::Result{};
        result.status = session::ExecutionStatus::kError;
        result.error = session::ExecutionError{"ExecutionError", ex.what(), {}};
    }
    result.completed_at = utils::Now();

    const auto status = result.status;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        requests_[request_id].status = status;
        results_[request_id] = std::move(result);
    }
    utils::LogInfo("service", "request " + request_id + " finished with status " + session::ToString(status));
}

void ExecutionService::AbandonRequest(const std::string& request_id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(requests_mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end() || it->second.status != session::ExecutionStatus::kInitializing) {
        return;
    }
    it->second.status = session::ExecutionStatus::kError;
    session::Result result;
    result.status = session::ExecutionStatus::kError;
    result.error = session::ExecutionError{"ExecutionError", reason, {}};
    result.completed_at = utils::Now();
    results_[request_id] = std::move(result);
    utils::LogWarn("service", "request " + request_id + " abandoned: " + reason);
}

std::optional<RequestStatus> ExecutionService::GetStatus(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(requests_mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return std::nullopt;
    }
    RequestStatus status;
    status.status = it->second.status;
    status.created_at = it->second.created_at;
    auto result = results_.find(request_id);
    if (result != results_.end()) {
        status.completed_at = result->second.completed_at;
    }
    return status;
}

std::optional<session::Result> ExecutionService::GetResult(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(requests_mutex_);
    auto it = results_.find(request_id);
    if (it == results_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ExecutionService::CleanupSession(const std::string& session_id) {
    auto entry = registry_.Remove(session_id);
    if (!entry) {
        utils::LogDebug("service", "cleanup of unknown session " + session_id);
        return;
    }
    Teardown(*entry);
}

std::size_t ExecutionService::CleanupIdleSessions(std::chrono::seconds max_idle) {
    std::size_t reaped = 0;
    for (const auto& entry : registry_.Snapshot()) {
        if (entry->IdleFor() <= max_idle) {
            continue;
        }
        auto idle_lock = entry->TryLockIdle();
        if (!idle_lock.owns_lock()) {
            continue;
        }
        if (!registry_.Remove(entry->Id())) {
            continue;
        }
        idle_lock.unlock();
        utils::LogInfo("service", "reaping idle session " + entry->Id());
        Teardown(*entry);
        ++reaped;
    }
    return reaped;
}

std::vector<session::SessionInfo> ExecutionService::ListSessions() const {
    std::vector<session::SessionInfo> sessions;
    for (const auto& entry : registry_.Snapshot()) {
        sessions.push_back(entry->Info());
    }
    return sessions;
}

std::optional<session::SessionInfo> ExecutionService::GetSession(const std::string& session_id) const {
    auto entry = registry_.Find(session_id);
    if (!entry) {
        return std::nullopt;
    }
    return entry->Info();
}

std::size_t ExecutionService::SessionCount() const {
    return registry_.Size();
}

void ExecutionService::Shutdown() {
    const bool first = !shut_down_.exchange(true);
    for (const auto& entry : registry_.RemoveAll()) {
        Teardown(*entry);
    }
    if (first) {
        backend_->Shutdown();
        utils::LogInfo("service", "execution service shut down");
    }
}

void ExecutionService::Teardown(session::SessionEntry& entry) {
    backend_->Destroy(entry.Handle());
    utils::LogInfo("service", "session " + entry.Id() + " cleaned up");
}

}  // namespace codebox::service
