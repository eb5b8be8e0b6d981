#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>

namespace ferry::concurrency {

// Process-wide guard around the remote session. Unlike std::mutex it may be
// released from a thread other than the one that acquired it.
class ExecutionLock {
public:
    virtual ~ExecutionLock() = default;

    virtual void acquire() = 0;
    virtual void release() = 0;
};

class SerialExecutionLock final : public ExecutionLock {
public:
    void acquire() override;
    void release() override;

    [[nodiscard]] bool isHeld() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool held_{false};
};

// For exercising worker logic without serialization.
class NoopExecutionLock final : public ExecutionLock {
public:
    void acquire() override {}
    void release() override {}
};

// RAII hold on an ExecutionLock. Shared so a helper thread running an
// abandoned call can keep the lock until the call returns.
class ExecutionLease {
public:
    explicit ExecutionLease(std::shared_ptr<ExecutionLock> lock);
    ~ExecutionLease();

    ExecutionLease(const ExecutionLease&) = delete;
    ExecutionLease& operator=(const ExecutionLease&) = delete;

    static std::shared_ptr<ExecutionLease> acquire(std::shared_ptr<ExecutionLock> lock) {
        return std::make_shared<ExecutionLease>(std::move(lock));
    }

private:
    std::shared_ptr<ExecutionLock> lock_;
};

} // namespace ferry::concurrency
