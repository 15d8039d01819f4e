#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "isolation/isolation_backend.hpp"
#include "kernel/protocol_exchange.hpp"
#include "session/session_types.hpp"

namespace codebox::session {

class SessionEntry {
public:
    SessionEntry(std::string id,
                 std::vector<std::string> dependencies,
                 ResourceOptions options,
                 std::unique_ptr<isolation::KernelHandle> handle);

    // One turn on the kernel. A second caller blocks until the first turn ends.
    kernel::ExchangeResult Exchange(const std::string& code);

    // Holds the exchange lock on success so no turn can start meanwhile.
    std::unique_lock<std::mutex> TryLockIdle();

    SessionInfo Info() const;
    std::chrono::system_clock::duration IdleFor() const;

    const std::string& Id() const { return id_; }
    const ResourceOptions& Options() const { return options_; }
    isolation::KernelHandle& Handle() { return *handle_; }

private:
    void Touch();

    std::string id_;
    std::vector<std::string> dependencies_;
    ResourceOptions options_;
    std::unique_ptr<isolation::KernelHandle> handle_;
    std::chrono::system_clock::time_point created_at_;
    std::chrono::system_clock::time_point last_used_at_;
    std::mutex exchange_mutex_;
    mutable std::mutex meta_mutex_;
    std::atomic<bool> executing_{false};
};

// Live sessions by id. Entries are shared so an execution in flight keeps its
// session alive while another thread tears it down.
class SessionRegistry {
public:
    void Insert(std::shared_ptr<SessionEntry> entry);
    std::shared_ptr<SessionEntry> Find(const std::string& id) const;
    std::shared_ptr<SessionEntry> Remove(const std::string& id);
    std::vector<std::shared_ptr<SessionEntry>> RemoveAll();
    std::vector<std::shared_ptr<SessionEntry>> Snapshot() const;
    std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionEntry>> sessions_;
};

}  // namespace codebox::session
