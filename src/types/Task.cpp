#include "types/Task.hpp"
#include "util/timestamp.hpp"

#include <stdexcept>

using namespace ferry::types;
using namespace ferry::util;

std::string ferry::types::to_string(const TaskStatus& status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Running: return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Skipped: return "skipped";
        case TaskStatus::Timeout: return "timeout";
        default: return "unknown";
    }
}

TaskStatus ferry::types::to_task_status(const std::string& str) {
    if (str == "pending") return TaskStatus::Pending;
    if (str == "running") return TaskStatus::Running;
    if (str == "completed") return TaskStatus::Completed;
    if (str == "failed") return TaskStatus::Failed;
    if (str == "skipped") return TaskStatus::Skipped;
    if (str == "timeout") return TaskStatus::Timeout;
    throw std::invalid_argument("Invalid task status string: " + str);
}

void StatusCounts::add(const TaskStatus status) {
    ++total;
    switch (status) {
        case TaskStatus::Pending: ++pending; break;
        case TaskStatus::Running: ++running; break;
        case TaskStatus::Completed: ++completed; break;
        case TaskStatus::Failed: ++failed; break;
        case TaskStatus::Skipped: ++skipped; break;
        case TaskStatus::Timeout: ++timeout; break;
    }
}

void ferry::types::to_json(nlohmann::json& j, const StatusCounts& c) {
    j = nlohmann::json{
        {"total", c.total},
        {"pending", c.pending},
        {"running", c.running},
        {"completed", c.completed},
        {"failed", c.failed},
        {"skipped", c.skipped},
        {"timeout", c.timeout}
    };
}

void ferry::types::task_base_to_json(nlohmann::json& j, const Task& t) {
    j["id"] = t.id ? nlohmann::json(*t.id) : nlohmann::json(nullptr);
    j["status"] = to_string(t.status);
    j["error_message"] = t.error_message;
    j["title"] = t.title;
    j["session_tag"] = t.session_tag;
    j["created_at"] = timestampToString(t.created_at);
    j["order_index"] = t.order_index;
    j["metadata"] = t.metadata;
}

void ferry::types::task_base_from_json(const nlohmann::json& j, Task& t) {
    if (j.contains("id") && !j["id"].is_null()) t.id = j.at("id").get<unsigned int>();
    else t.id.reset();
    t.status = to_task_status(j.value("status", std::string("pending")));
    t.error_message = j.value("error_message", std::string{});
    t.title = j.value("title", std::string{});
    t.session_tag = j.value("session_tag", std::string{});
    if (j.contains("created_at")) t.created_at = parseTimestampFromString(j.at("created_at").get<std::string>());
    t.order_index = j.value("order_index", 0);
    t.metadata = j.contains("metadata") && j["metadata"].is_object() ? j["metadata"] : nlohmann::json::object();
}
