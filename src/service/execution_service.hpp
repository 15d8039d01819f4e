#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"
#include "isolation/isolation_backend.hpp"
#include "kernel/protocol_exchange.hpp"
#include "session/session_registry.hpp"
#include "session/session_types.hpp"

namespace codebox::service {

struct ExecutionRequest {
    std::string id;
    std::string session_id;
    std::string code;
    std::vector<std::string> disabled_rules;
    session::ExecutionStatus status = session::ExecutionStatus::kInitializing;
    std::chrono::system_clock::time_point created_at;
};

struct RequestStatus {
    session::ExecutionStatus status = session::ExecutionStatus::kInitializing;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;
};

// Maps a finished exchange onto the caller-facing Result. Images become file
// payloads, plain text becomes a result output, other representations drop.
session::Result TranslateExchange(const kernel::ExchangeResult& exchange);

// Owns the live sessions and the requests submitted against them.
class ExecutionService {
public:
    ExecutionService(std::shared_ptr<isolation::IsolationBackend> backend,
                     config::ExecutionDefaults defaults = {});
    ~ExecutionService();

    ExecutionService(const ExecutionService&) = delete;
    ExecutionService& operator=(const ExecutionService&) = delete;

    // Throws ValidationRejected, IsolationStartupFailure or
    // DependencyInstallFailure; nothing is registered on failure.
    std::string CreateSession(const std::vector<std::string>& dependencies,
                              const session::ResourceOptions& options);

    // Throws SessionNotFound or ValidationRejected (code too long).
    std::string CreateExecutionRequest(const std::string& code,
                                       const std::string& session_id,
                                       const std::vector<std::string>& disabled_rules = {});

    // Runs a request to a terminal status. Never throws.
    void ExecuteCode(const std::string& request_id);

    // Ends a request that will never run with status error. Requests already
    // past initializing are left alone.
    void AbandonRequest(const std::string& request_id, const std::string& reason);

    std::optional<RequestStatus> GetStatus(const std::string& request_id) const;
    // Absent until the request reached a terminal status.
    std::optional<session::Result> GetResult(const std::string& request_id) const;

    // Idempotent; unknown ids are ignored.
    void CleanupSession(const std::string& session_id);
    // Sessions idle longer than max_idle and not executing. Returns how many went.
    std::size_t CleanupIdleSessions(std::chrono::seconds max_idle);

    std::vector<session::SessionInfo> ListSessions() const;
    std::optional<session::SessionInfo> GetSession(const std::string& session_id) const;
    std::size_t SessionCount() const;

    const config::ExecutionDefaults& Defaults() const { return defaults_; }

    void Shutdown();

private:
    void Teardown(session::SessionEntry& entry);

    std::shared_ptr<isolation::IsolationBackend> backend_;
    config::ExecutionDefaults defaults_;
    session::SessionRegistry registry_;
    mutable std::mutex requests_mutex_;
    std::unordered_map<std::string, ExecutionRequest> requests_;
    std::unordered_map<std::string, session::Result> results_;
    std::atomic<bool> shut_down_{false};
};

}  // namespace codebox::service
