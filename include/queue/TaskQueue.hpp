#pragma once

#include "types/Task.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace ferry::queue {

// Ordered tasks of one kind. All access goes through the queue's mutex; the
// backing vector is never handed out.
template <typename T>
class TaskQueue {
public:
    using TaskPtr = std::shared_ptr<T>;

    struct Claim {
        TaskPtr task;
        std::size_t index{};
        T copy; // state right after the claim
    };

    void append(TaskPtr task) {
        {
            std::scoped_lock lock(mutex_);
            tasks_.push_back(std::move(task));
        }
        cv_.notify_all();
    }

    void replaceAll(std::vector<TaskPtr> tasks) {
        {
            std::scoped_lock lock(mutex_);
            tasks_ = std::move(tasks);
        }
        cv_.notify_all();
    }

    // First pending task in scan order, moved to running.
    std::optional<Claim> claimNextPending() {
        std::scoped_lock lock(mutex_);
        for (std::size_t i = 0; i < tasks_.size(); ++i) {
            if (tasks_[i]->status != types::TaskStatus::Pending) continue;
            tasks_[i]->status = types::TaskStatus::Running;
            tasks_[i]->error_message.clear();
            return Claim{tasks_[i], i, *tasks_[i]};
        }
        return std::nullopt;
    }

    // Blocks until a task is pending, interrupted is set, wake() is called or maxWait passes.
    bool waitForPending(const std::chrono::milliseconds maxWait, const std::atomic<bool>& interrupted) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, maxWait, [&] { return interrupted.load() || hasPendingLocked(); });
    }

    bool waitUntil(const std::chrono::milliseconds maxWait, const std::function<bool()>& pred) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, maxWait, pred);
    }

    void wake() {
        // Take the lock so a waiter between its predicate check and the wait cannot miss this.
        { std::scoped_lock lock(mutex_); }
        cv_.notify_all();
    }

    // Runs fn on the task under the queue lock. False if the task is no longer queued.
    bool mutate(const TaskPtr& task, const std::function<void(T&)>& fn) {
        std::scoped_lock lock(mutex_);
        if (std::find(tasks_.begin(), tasks_.end(), task) == tasks_.end()) return false;
        fn(*task);
        return true;
    }

    bool mutateById(const unsigned int id, const std::function<void(T&)>& fn) {
        std::scoped_lock lock(mutex_);
        const auto it = findLocked(id);
        if (it == tasks_.end()) return false;
        fn(**it);
        return true;
    }

    bool removeById(const unsigned int id) {
        std::scoped_lock lock(mutex_);
        const auto it = findLocked(id);
        if (it == tasks_.end()) return false;
        tasks_.erase(it);
        return true;
    }

    // Queue becomes exactly the named tasks, in the given order. Unknown ids are ignored.
    void reorder(const std::vector<unsigned int>& ids) {
        {
            std::scoped_lock lock(mutex_);
            std::vector<TaskPtr> reordered;
            reordered.reserve(ids.size());
            for (const auto id : ids) {
                const auto it = findLocked(id);
                if (it == tasks_.end()) continue;
                if (std::find(reordered.begin(), reordered.end(), *it) != reordered.end()) continue;
                reordered.push_back(*it);
            }
            tasks_ = std::move(reordered);
        }
        cv_.notify_all();
    }

    // Removes every task, or only those with the given status. Returns the number removed.
    std::size_t clear(const std::optional<types::TaskStatus>& status = std::nullopt) {
        std::scoped_lock lock(mutex_);
        const auto before = tasks_.size();
        if (!status) tasks_.clear();
        else std::erase_if(tasks_, [&](const TaskPtr& t) { return t->status == *status; });
        return before - tasks_.size();
    }

    [[nodiscard]] std::optional<T> findById(const unsigned int id) const {
        std::scoped_lock lock(mutex_);
        const auto it = findLocked(id);
        if (it == tasks_.end()) return std::nullopt;
        return **it;
    }

    [[nodiscard]] std::vector<T> snapshot() const {
        std::scoped_lock lock(mutex_);
        std::vector<T> out;
        out.reserve(tasks_.size());
        for (const auto& t : tasks_) out.push_back(*t);
        return out;
    }

    [[nodiscard]] types::StatusCounts counts() const {
        std::scoped_lock lock(mutex_);
        types::StatusCounts c;
        for (const auto& t : tasks_) c.add(t->status);
        return c;
    }

    [[nodiscard]] std::size_t size() const {
        std::scoped_lock lock(mutex_);
        return tasks_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<TaskPtr> tasks_;

    bool hasPendingLocked() const {
        return std::any_of(tasks_.begin(), tasks_.end(),
                           [](const TaskPtr& t) { return t->status == types::TaskStatus::Pending; });
    }

    auto findLocked(const unsigned int id) const {
        return std::find_if(tasks_.begin(), tasks_.end(),
                            [id](const TaskPtr& t) { return t->id && *t->id == id; });
    }

    auto findLocked(const unsigned int id) {
        return std::find_if(tasks_.begin(), tasks_.end(),
                            [id](const TaskPtr& t) { return t->id && *t->id == id; });
    }
};

} // namespace ferry::queue
