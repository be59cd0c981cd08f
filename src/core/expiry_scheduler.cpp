/**
 * @file expiry_scheduler.cpp
 * @brief Expiry worker thread
 *
 * @date 2025
 */

#include "sandcell/core/expiry_scheduler.hpp"

#include <spdlog/spdlog.h>

namespace sandcell {
namespace core {

ExpiryScheduler::ExpiryScheduler()
    : worker_(&ExpiryScheduler::WorkerLoop, this) {}

ExpiryScheduler::~ExpiryScheduler() {
    Stop();
}

void ExpiryScheduler::Schedule(const std::string& id,
                               std::chrono::milliseconds delay,
                               Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            spdlog::debug("Expiry: scheduler stopped, ignoring {}", id);
            return;
        }
        Task& task = tasks_[id];
        task.deadline = Clock::now() + delay;
        task.callback = std::move(callback);
    }
    cv_.notify_all();

    spdlog::debug("Expiry: {} armed for {}s", id,
                  std::chrono::duration_cast<std::chrono::seconds>(delay).count());
}

bool ExpiryScheduler::Cancel(const std::string& id) {
    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled = tasks_.erase(id) > 0;
    }
    if (cancelled) {
        cv_.notify_all();
        spdlog::debug("Expiry: {} cancelled", id);
    }
    return cancelled;
}

std::optional<ExpiryScheduler::Clock::time_point>
ExpiryScheduler::Deadline(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second.deadline;
}

std::size_t ExpiryScheduler::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ExpiryScheduler::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable()) {
            return;
        }
        stopping_ = true;
        tasks_.clear();
    }
    cv_.notify_all();

    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

// ============================================================================
// WORKER
// ============================================================================

void ExpiryScheduler::WorkerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopping_) {
        if (tasks_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto earliest = tasks_.begin();
        for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
            if (it->second.deadline < earliest->second.deadline) {
                earliest = it;
            }
        }

        // Copy: the task may be cancelled while we wait
        const Clock::time_point deadline = earliest->second.deadline;
        if (Clock::now() < deadline) {
            cv_.wait_until(lock, deadline);
            continue;
        }

        std::string id = earliest->first;
        Callback callback = std::move(earliest->second.callback);
        tasks_.erase(earliest);

        lock.unlock();
        spdlog::info("Expiry: deadline reached for {}", id);
        try {
            if (callback) {
                callback();
            }
        } catch (const std::exception& e) {
            spdlog::error("Expiry: cleanup of {} failed: {}", id, e.what());
        }
        lock.lock();
    }
}

} // namespace core
} // namespace sandcell
