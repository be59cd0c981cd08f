/**
 * @file session_registry.hpp
 * @brief Process-wide cache of live sessions
 *
 * Each tool invocation may run in a fresh process, so this map is only a
 * cache: the runtime is the source of truth for whether a sandbox exists.
 * Backends fall back to a by-name lookup against the runtime on a miss.
 *
 * **Per-identifier states**:
 * ```
 * UNKNOWN --create / by-name lookup--> REGISTERED(running)
 * REGISTERED(running) --liveness check fails--> REGISTERED(stale)
 * REGISTERED(stale) --purge--> ABSENT
 * REGISTERED(running) --kill / expiry--> ABSENT
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandcell/core/session.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sandcell {
namespace core {

/**
 * @class SessionRegistry
 * @brief Mutex-guarded `session_id -> Session` map
 *
 * The lock covers map access only and is never held across a runtime
 * call. One instance per process, created empty on first use and never
 * torn down (process exit reclaims it).
 *
 * **Thread Safety**: all methods are thread-safe.
 */
class SessionRegistry {
public:
    /// The process-wide registry
    static SessionRegistry& Instance();

    SessionRegistry() = default;
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    std::shared_ptr<Session> Find(const std::string& session_id) const;

    /// Insert or replace the entry for the session's identifier
    void Insert(std::shared_ptr<Session> session);

    /// Remove an entry; returns whether one existed
    bool Remove(const std::string& session_id);

    /// Remove the entry only while it still maps to this exact session object
    bool RemoveIfSame(const std::shared_ptr<Session>& session);

    bool Contains(const std::string& session_id) const;
    std::size_t Size() const;
    std::vector<std::string> Ids() const;

    /// Drop every entry (a fresh process looks like this)
    void Clear();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace core
} // namespace sandcell
