/**
 * @file expiry_scheduler.hpp
 * @brief Deadline-driven background removal of idle sandboxes
 *
 * One worker thread per backend sleeps until the earliest pending deadline
 * and then runs that session's callback. Scheduling an identifier again
 * replaces the previous task, which is how a timeout change cancels and
 * re-arms expiry.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace sandcell {
namespace core {

/**
 * @class ExpiryScheduler
 * @brief Per-session deadline table served by a single worker thread
 *
 * Callbacks run on the worker thread with no scheduler lock held, so they
 * may call back into Schedule/Cancel. An exception escaping a callback is
 * logged and dropped; it never stops the worker.
 *
 * **Usage Example**:
 * @code
 * ExpiryScheduler scheduler;
 * scheduler.Schedule("sc-1a2b3c4d5e6f", std::chrono::seconds(1800), [] {
 *     // remove the sandbox
 * });
 * scheduler.Cancel("sc-1a2b3c4d5e6f");
 * @endcode
 *
 * **Thread Safety**: all methods are thread-safe.
 */
class ExpiryScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    ExpiryScheduler();
    ~ExpiryScheduler();

    ExpiryScheduler(const ExpiryScheduler&) = delete;
    ExpiryScheduler& operator=(const ExpiryScheduler&) = delete;

    /**
     * @brief Arm (or re-arm) expiry for an identifier
     * @param id Session identifier
     * @param delay Time from now until the callback fires
     * @param callback Work to run at the deadline
     */
    void Schedule(const std::string& id, std::chrono::milliseconds delay, Callback callback);

    /// Drop a pending task; returns whether one existed
    bool Cancel(const std::string& id);

    /// Deadline of the pending task for an identifier
    std::optional<Clock::time_point> Deadline(const std::string& id) const;

    /// Number of pending tasks
    std::size_t Pending() const;

    /// Stop the worker and drop every pending task (idempotent)
    void Stop();

private:
    struct Task {
        Clock::time_point deadline;
        Callback callback;
    };

    void WorkerLoop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Task> tasks_;
    bool stopping_{false};
    std::thread worker_;
};

} // namespace core
} // namespace sandcell
