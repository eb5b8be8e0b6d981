#pragma once

#include "services/AsyncService.hpp"

#include <chrono>
#include <functional>

namespace ferry::queue { class EventChannel; struct WorkerEvent; }

namespace ferry::services {

// Drains the worker event channel on its own thread and hands each event to
// a single handler.
class EventDispatcher final : public AsyncService {
public:
    using Handler = std::function<void(const queue::WorkerEvent&)>;

    EventDispatcher(queue::EventChannel& channel, Handler handler,
                    std::chrono::milliseconds idleWait = std::chrono::milliseconds(500));

    ~EventDispatcher() override;

protected:
    void runLoop() override;
    void wakeUp() override;

private:
    queue::EventChannel& channel_;
    Handler handler_;
    std::chrono::milliseconds idleWait_;
};

} // namespace ferry::services
