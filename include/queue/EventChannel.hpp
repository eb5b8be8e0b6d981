#pragma once

#include "queue/WorkerEvent.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace ferry::queue {

// FIFO between the workers and the orchestrator. Workers publish, one
// consumer drains.
class EventChannel {
public:
    void publish(WorkerEvent event);

    std::optional<WorkerEvent> tryPop();

    // Waits up to maxWait for an event.
    std::optional<WorkerEvent> waitPop(std::chrono::milliseconds maxWait);

    std::vector<WorkerEvent> drain();

    // Releases a consumer blocked in waitPop.
    void wake();

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<WorkerEvent> events_;
    bool woken_{false};
};

} // namespace ferry::queue
