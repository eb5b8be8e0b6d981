#pragma once

#include "types/Task.hpp"

#include <vector>
#include <nlohmann/json.hpp>

namespace ferry::types {

// Read-only projection of one queue for external reporting.
template <typename T>
struct QueueSnapshot {
    StatusCounts counts;
    bool is_running{false};
    bool is_paused{false};
    std::vector<T> tasks;
};

template <typename T>
void to_json(nlohmann::json& j, const QueueSnapshot<T>& s) {
    j = nlohmann::json(s.counts);
    j["is_running"] = s.is_running;
    j["is_paused"] = s.is_paused;
    j["tasks"] = s.tasks;
}

} // namespace ferry::types
