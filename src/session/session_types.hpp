#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codebox::session {

struct MountPoint {
    std::string host_path;
    std::string container_path;
    bool read_only = true;
};

struct ResourceOptions {
    // Longest wait for the next kernel message, not for the whole execution.
    int timeout_s = 60;
    std::string memory_limit = "2G";
    std::string cpu_limit = "1";
    std::map<std::string, std::string> environment;
    std::vector<MountPoint> mount_points;
};

enum class ExecutionStatus {
    kInitializing,
    kRunning,
    kCompleted,
    kFailed,
    kError
};

inline const char* ToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::kInitializing: return "initializing";
        case ExecutionStatus::kRunning: return "running";
        case ExecutionStatus::kCompleted: return "completed";
        case ExecutionStatus::kFailed: return "failed";
        case ExecutionStatus::kError: return "error";
    }
    return "unknown";
}

inline bool IsTerminal(ExecutionStatus status) {
    return status == ExecutionStatus::kCompleted
        || status == ExecutionStatus::kFailed
        || status == ExecutionStatus::kError;
}

struct Output {
    std::string type;
    std::string content;
    std::string name;
    std::string mime_type;
};

struct ExecutionError {
    std::string name;
    std::string message;
    std::vector<std::string> traceback;
};

struct FilePayload {
    std::string mime_type;
    std::string data;
};

struct Result {
    ExecutionStatus status = ExecutionStatus::kCompleted;
    std::vector<Output> outputs;
    std::optional<ExecutionError> error;
    std::vector<FilePayload> files;
    std::chrono::system_clock::time_point completed_at;
};

struct SessionInfo {
    std::string id;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_used_at;
    std::vector<std::string> dependencies;
    bool executing = false;
};

// "512m", "2G", "1024" (bytes). Throws ValidationRejected.
std::int64_t ParseMemoryLimit(const std::string& value);
// "1", "0.5" cores as Docker NanoCpus. Throws ValidationRejected.
std::int64_t ParseNanoCpus(const std::string& value);

// Timeout range, limit syntax and every mount point.
void ValidateResourceOptions(const ResourceOptions& options);

}  // namespace codebox::session
