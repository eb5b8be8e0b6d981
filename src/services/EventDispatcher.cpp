#include "services/EventDispatcher.hpp"
#include "queue/EventChannel.hpp"
#include "logging/LogRegistry.hpp"

using namespace ferry::services;
using namespace ferry::queue;
using namespace ferry::logging;

EventDispatcher::EventDispatcher(EventChannel& channel, Handler handler, const std::chrono::milliseconds idleWait)
    : AsyncService("EventDispatcher"), channel_(channel), handler_(std::move(handler)), idleWait_(idleWait) {}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::runLoop() {
    while (!interruptFlag_.load()) {
        const auto event = channel_.waitPop(idleWait_);
        if (!event) continue;

        try {
            handler_(*event);
        } catch (const std::exception& e) {
            LogRegistry::ferry()->error("[EventDispatcher] Handler failed for {} event: {}",
                                        to_string(event->kind), e.what());
        }
    }

    // Deliver what the workers published before the stop.
    while (const auto event = channel_.tryPop()) {
        try {
            handler_(*event);
        } catch (const std::exception& e) {
            LogRegistry::ferry()->error("[EventDispatcher] Handler failed while draining: {}", e.what());
        }
    }
}

void EventDispatcher::wakeUp() {
    channel_.wake();
}
