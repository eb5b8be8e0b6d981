#pragma once

#include "queue/WorkerEvent.hpp"

#include <cstddef>
#include <string>

namespace ferry::services {

// Caller-facing notifications, delivered from the event dispatcher thread in
// publication order. Implementations must return quickly.
class QueueObserver {
public:
    virtual ~QueueObserver() = default;

    virtual void onProgress(queue::QueueKind, std::size_t, types::TaskStatus) {}

    virtual void onTransferCompleted(std::size_t, const std::string&, const types::TransferTask&) {}

    virtual void onShareCompleted(std::size_t, const std::string&, const std::string&) {}

    virtual void onFailed(queue::QueueKind, std::size_t, const std::string&) {}

    virtual void logLine(const std::string&) {}
};

} // namespace ferry::services
