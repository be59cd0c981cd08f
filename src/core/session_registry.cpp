/**
 * @file session_registry.cpp
 * @brief Process-wide session cache
 *
 * @date 2025
 */

#include "sandcell/core/session_registry.hpp"

#include <spdlog/spdlog.h>

namespace sandcell {
namespace core {

SessionRegistry& SessionRegistry::Instance() {
    static SessionRegistry instance;
    return instance;
}

std::shared_ptr<Session> SessionRegistry::Find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

void SessionRegistry::Insert(std::shared_ptr<Session> session) {
    if (!session) {
        return;
    }
    std::string id = session->Id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[id] = std::move(session);
    }
    spdlog::debug("Registry: registered {}", id);
}

bool SessionRegistry::Remove(const std::string& session_id) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = sessions_.erase(session_id) > 0;
    }
    if (removed) {
        spdlog::debug("Registry: purged {}", session_id);
    }
    return removed;
}

bool SessionRegistry::RemoveIfSame(const std::shared_ptr<Session>& session) {
    if (!session) {
        return false;
    }
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session->Id());
        if (it != sessions_.end() && it->second == session) {
            sessions_.erase(it);
            removed = true;
        }
    }
    if (removed) {
        spdlog::debug("Registry: purged {}", session->Id());
    }
    return removed;
}

bool SessionRegistry::Contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

std::size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::Ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void SessionRegistry::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.clear();
}

} // namespace core
} // namespace sandcell
