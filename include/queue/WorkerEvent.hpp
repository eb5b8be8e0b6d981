#pragma once

#include "types/ShareTask.hpp"
#include "types/TransferTask.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace ferry::queue {

enum class QueueKind { Transfer, Share };

std::string to_string(const QueueKind& kind);

struct WorkerEvent {
    enum class Type { Progress, Completed, Failed, Log };

    Type type{Type::Log};
    QueueKind kind{QueueKind::Transfer};
    std::size_t index{};
    types::TaskStatus status{types::TaskStatus::Pending};
    std::string message;

    // Task state at publication, set for the matching kind on Completed.
    std::optional<types::TransferTask> transfer;
    std::optional<types::ShareTask> share;
};

} // namespace ferry::queue
