#include "concurrency/ExecutionLock.hpp"

#include <stdexcept>

using namespace ferry::concurrency;

void SerialExecutionLock::acquire() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !held_; });
    held_ = true;
}

void SerialExecutionLock::release() {
    {
        std::scoped_lock lock(mutex_);
        held_ = false;
    }
    cv_.notify_one();
}

bool SerialExecutionLock::isHeld() const {
    std::scoped_lock lock(mutex_);
    return held_;
}

ExecutionLease::ExecutionLease(std::shared_ptr<ExecutionLock> lock) : lock_(std::move(lock)) {
    if (!lock_) throw std::invalid_argument("ExecutionLease requires a lock");
    lock_->acquire();
}

ExecutionLease::~ExecutionLease() {
    lock_->release();
}
