/**
 * @file session.cpp
 * @brief Session bookkeeping
 *
 * @date 2025
 */

#include "sandcell/core/session.hpp"

namespace sandcell {
namespace core {

std::string BackendKindToString(BackendKind kind) {
    switch (kind) {
        case BackendKind::LOCAL: return "local";
        case BackendKind::REMOTE: return "remote";
        default: return "unknown";
    }
}

Session::Session(std::string session_id,
                 BackendKind backend,
                 std::string resource_id,
                 std::chrono::seconds timeout,
                 Clock::time_point created_at)
    : session_id_(std::move(session_id)),
      backend_(backend),
      resource_id_(std::move(resource_id)),
      created_at_(created_at),
      timeout_(timeout),
      deadline_(created_at + timeout) {}

std::chrono::seconds Session::Timeout() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timeout_;
}

Session::Clock::time_point Session::Deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deadline_;
}

Session::Clock::time_point Session::ResetTimeout(std::chrono::seconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    timeout_ = timeout;
    deadline_ = Clock::now() + timeout;
    return deadline_;
}

void Session::RestoreDeadline(Clock::time_point deadline) {
    std::lock_guard<std::mutex> lock(mutex_);
    deadline_ = deadline;
    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(deadline - Clock::now());
    timeout_ = remaining.count() > 0 ? remaining : std::chrono::seconds(0);
}

} // namespace core
} // namespace sandcell
