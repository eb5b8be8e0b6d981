#pragma once

#include "concurrency/ExecutionLock.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

namespace ferry::concurrency {

class RemoteTimeout : public std::runtime_error {
public:
    explicit RemoteTimeout(const std::chrono::milliseconds deadline)
        : std::runtime_error("remote call exceeded " + std::to_string(deadline.count()) + " ms"),
          deadline_(deadline) {}

    [[nodiscard]] std::chrono::milliseconds deadline() const { return deadline_; }

private:
    std::chrono::milliseconds deadline_;
};

// Runs fn with the caller's lease held. A non-positive deadline runs it inline.
// Otherwise fn runs on a detached thread that owns a copy of the lease; if the
// deadline passes first RemoteTimeout is thrown and the lock stays held until
// fn actually returns. fn must own everything it touches.
template <typename Fn>
std::invoke_result_t<Fn> runRemoteCall(const std::shared_ptr<ExecutionLease>& lease,
                                       const std::chrono::milliseconds deadline,
                                       Fn&& fn) {
    if (deadline.count() <= 0) return fn();

    using Result = std::invoke_result_t<Fn>;
    std::packaged_task<Result()> task(std::forward<Fn>(fn));
    auto future = task.get_future();

    std::thread([task = std::move(task), lease]() mutable { task(); }).detach();

    if (future.wait_for(deadline) == std::future_status::timeout) throw RemoteTimeout(deadline);
    return future.get();
}

} // namespace ferry::concurrency
