#include "session/session_registry.hpp"

#include "utils/common.hpp"

namespace codebox::session {

SessionEntry::SessionEntry(std::string id,
                           std::vector<std::string> dependencies,
                           ResourceOptions options,
                           std::unique_ptr<isolation::KernelHandle> handle)
    : id_(std::move(id))
    , dependencies_(std::move(dependencies))
    , options_(std::move(options))
    , handle_(std::move(handle))
    , created_at_(utils::Now())
    , last_used_at_(created_at_) {}

kernel::ExchangeResult SessionEntry::Exchange(const std::string& code) {
    std::lock_guard<std::mutex> lock(exchange_mutex_);
    if (!handle_ || !handle_->channel) {
        kernel::ExchangeResult result;
        result.end = kernel::ExchangeEnd::kChannelFailure;
        result.error = kernel::KernelError{"ExecutionError", "session " + id_ + " has no kernel channel", {}};
        return result;
    }
    executing_ = true;
    auto result = kernel::RunExchange(*handle_->channel, code, std::chrono::seconds(options_.timeout_s));
    executing_ = false;
    Touch();
    return result;
}

std::unique_lock<std::mutex> SessionEntry::TryLockIdle() {
    return std::unique_lock<std::mutex>(exchange_mutex_, std::try_to_lock);
}

SessionInfo SessionEntry::Info() const {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return SessionInfo{id_, created_at_, last_used_at_, dependencies_, executing_.load()};
}

std::chrono::system_clock::duration SessionEntry::IdleFor() const {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return utils::Now() - last_used_at_;
}

void SessionEntry::Touch() {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    last_used_at_ = utils::Now();
}

void SessionRegistry::Insert(std::shared_ptr<SessionEntry> entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = entry->Id();
    sessions_[id] = std::move(entry);
}

std::shared_ptr<SessionEntry> SessionRegistry::Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<SessionEntry> SessionRegistry::Remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    auto entry = std::move(it->second);
    sessions_.erase(it);
    return entry;
}

std::vector<std::shared_ptr<SessionEntry>> SessionRegistry::RemoveAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<SessionEntry>> entries;
    entries.reserve(sessions_.size());
    for (auto& item : sessions_) {
        entries.push_back(std::move(item.second));
    }
    sessions_.clear();
    return entries;
}

std::vector<std::shared_ptr<SessionEntry>> SessionRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<SessionEntry>> entries;
    entries.reserve(sessions_.size());
    for (const auto& item : sessions_) {
        entries.push_back(item.second);
    }
    return entries;
}

std::size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace codebox::session
