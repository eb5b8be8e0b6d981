#pragma once

#include <cstddef>
#include <ctime>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace ferry::types {

enum class TaskStatus { Pending, Running, Completed, Failed, Skipped, Timeout };

std::string to_string(const TaskStatus& status);
TaskStatus to_task_status(const std::string& str);

[[nodiscard]] constexpr bool isTerminal(const TaskStatus status) {
    return status == TaskStatus::Completed || status == TaskStatus::Failed ||
           status == TaskStatus::Skipped || status == TaskStatus::Timeout;
}

// Shape shared by transfer and share tasks.
struct Task {
    std::optional<unsigned int> id;
    TaskStatus status{TaskStatus::Pending};
    std::string error_message;
    std::string title;
    std::string session_tag;
    std::time_t created_at{};
    int order_index{};
    nlohmann::json metadata = nlohmann::json::object();

    virtual ~Task() = default;

    [[nodiscard]] bool isPersisted() const { return id.has_value(); }
};

struct StatusCounts {
    std::size_t total{}, pending{}, running{}, completed{}, failed{}, skipped{}, timeout{};

    void add(TaskStatus status);
};

void to_json(nlohmann::json& j, const StatusCounts& c);

// Fields every task kind serializes the same way.
void task_base_to_json(nlohmann::json& j, const Task& t);
void task_base_from_json(const nlohmann::json& j, Task& t);

} // namespace ferry::types
