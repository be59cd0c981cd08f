/**
 * @file session.hpp
 * @brief The unit of isolation: one sandbox resource and its bookkeeping
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <mutex>
#include <string>

namespace sandcell {
namespace core {

/**
 * @enum BackendKind
 * @brief Which implementation owns a session
 */
enum class BackendKind {
    LOCAL,   ///< Locally managed container runtime
    REMOTE   ///< Remote cloud sandbox provider
};

std::string BackendKindToString(BackendKind kind);

/**
 * @class Session
 * @brief Live handle to one sandbox
 *
 * The identifier doubles as the underlying resource's name, which is what
 * lets a fresh process find the sandbox again. Identity fields are fixed at
 * construction; timeout and deadline change through SetTimeout and are
 * guarded by an internal mutex because expiry and callers may touch them
 * from different threads.
 */
class Session {
public:
    using Clock = std::chrono::system_clock;

    Session(std::string session_id,
            BackendKind backend,
            std::string resource_id,
            std::chrono::seconds timeout,
            Clock::time_point created_at = Clock::now());

    const std::string& Id() const { return session_id_; }
    BackendKind Backend() const { return backend_; }
    const std::string& ResourceId() const { return resource_id_; }
    Clock::time_point CreatedAt() const { return created_at_; }

    std::chrono::seconds Timeout() const;
    Clock::time_point Deadline() const;

    /// Set a new timeout counted from now; returns the new deadline
    Clock::time_point ResetTimeout(std::chrono::seconds timeout);

    /// Restore a deadline recovered from the resource (reattachment)
    void RestoreDeadline(Clock::time_point deadline);

    /// Remote data-plane address and token (unused by the local backend)
    std::string endpoint;
    std::string access_token;

private:
    const std::string session_id_;
    const BackendKind backend_;
    const std::string resource_id_;
    const Clock::time_point created_at_;

    mutable std::mutex mutex_;
    std::chrono::seconds timeout_;
    Clock::time_point deadline_;
};

} // namespace core
} // namespace sandcell
