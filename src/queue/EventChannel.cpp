#include "queue/EventChannel.hpp"

#include <iterator>

using namespace ferry::queue;

std::string ferry::queue::to_string(const QueueKind& kind) {
    switch (kind) {
        case QueueKind::Transfer: return "transfer";
        case QueueKind::Share: return "share";
        default: return "unknown";
    }
}

void EventChannel::publish(WorkerEvent event) {
    {
        std::scoped_lock lock(mutex_);
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<WorkerEvent> EventChannel::tryPop() {
    std::scoped_lock lock(mutex_);
    if (events_.empty()) return std::nullopt;
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<WorkerEvent> EventChannel::waitPop(const std::chrono::milliseconds maxWait) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, maxWait, [this] { return !events_.empty() || woken_; });
    woken_ = false;
    if (events_.empty()) return std::nullopt;
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::vector<WorkerEvent> EventChannel::drain() {
    std::scoped_lock lock(mutex_);
    std::vector<WorkerEvent> out(std::make_move_iterator(events_.begin()),
                                 std::make_move_iterator(events_.end()));
    events_.clear();
    return out;
}

void EventChannel::wake() {
    {
        std::scoped_lock lock(mutex_);
        woken_ = true;
    }
    cv_.notify_all();
}

std::size_t EventChannel::size() const {
    std::scoped_lock lock(mutex_);
    return events_.size();
}
