#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace ferry::config {

static std::string level_name(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

Config loadConfig(const std::string& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path);

    if (auto node = root["throttle"]) YAML::convert<ThrottleConfig>::decode(node, cfg.throttle);
    if (auto node = root["queue"]) YAML::convert<QueueConfig>::decode(node, cfg.queue);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (cfg.throttle.jitter_ms_min > cfg.throttle.jitter_ms_max)
        throw std::invalid_argument("throttle.jitter_ms_min must not exceed throttle.jitter_ms_max");
    if (cfg.throttle.ops_per_window == 0)
        throw std::invalid_argument("throttle.ops_per_window must be greater than zero");

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"throttle", c.throttle},
        {"queue", c.queue},
        {"database", c.database},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("throttle")) j.at("throttle").get_to(c.throttle);
    if (j.contains("queue")) j.at("queue").get_to(c.queue);
    if (j.contains("database")) j.at("database").get_to(c.database);
}

void to_json(nlohmann::json& j, const ThrottleConfig& c) {
    j = {
        {"jitter_ms_min", c.jitter_ms_min},
        {"jitter_ms_max", c.jitter_ms_max},
        {"ops_per_window", c.ops_per_window},
        {"window_sec", c.window_sec},
        {"window_rest_sec", c.window_rest_sec},
        {"max_consecutive_failures", c.max_consecutive_failures},
        {"pause_sec_on_failure", c.pause_sec_on_failure},
        {"cooldown_on_too_many_accesses_sec", c.cooldown_on_too_many_accesses_sec},
        {"backoff_factor", c.backoff_factor}
    };
}

void from_json(const nlohmann::json& j, ThrottleConfig& c) {
    c.jitter_ms_min = j.value("jitter_ms_min", 500u);
    c.jitter_ms_max = j.value("jitter_ms_max", 1500u);
    c.ops_per_window = j.value("ops_per_window", 50u);
    c.window_sec = j.value("window_sec", 60u);
    c.window_rest_sec = j.value("window_rest_sec", 20u);
    c.max_consecutive_failures = j.value("max_consecutive_failures", 5u);
    c.pause_sec_on_failure = j.value("pause_sec_on_failure", 60u);
    c.cooldown_on_too_many_accesses_sec = j.value("cooldown_on_too_many_accesses_sec", 120u);
    c.backoff_factor = j.value("backoff_factor", 1.5);
}

void to_json(nlohmann::json& j, const QueueConfig& c) {
    j = {
        {"default_target_path", c.default_target_path},
        {"default_share_expiry_days", c.default_share_expiry_days},
        {"idle_poll_ms", c.idle_poll_ms},
        {"pause_poll_ms", c.pause_poll_ms},
        {"remote_call_timeout_ms", c.remote_call_timeout_ms}
    };
}

void from_json(const nlohmann::json& j, QueueConfig& c) {
    c.default_target_path = j.value("default_target_path", std::string("/batch-transfer"));
    c.default_share_expiry_days = j.value("default_share_expiry_days", 7u);
    c.idle_poll_ms = j.value("idle_poll_ms", 500u);
    c.pause_poll_ms = j.value("pause_poll_ms", 100u);
    c.remote_call_timeout_ms = j.value("remote_call_timeout_ms", 0u);
}

// password is intentionally never serialized
void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user},
        {"pool_size", c.pool_size}
    };
}

void from_json(const nlohmann::json& j, DatabaseConfig& c) {
    c.host = j.value("host", std::string("localhost"));
    c.port = j.value("port", static_cast<uint16_t>(5432));
    c.name = j.value("name", std::string("ferry"));
    c.user = j.value("user", std::string("ferry"));
    c.pool_size = j.value("pool_size", 4u);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    const auto& sub = c.levels.subsystem_levels;
    j = {
        {"log_dir", c.log_dir.string()},
        {"console_log_level", level_name(c.levels.console_log_level)},
        {"file_log_level", level_name(c.levels.file_log_level)},
        {"subsystem_levels", {
            {"ferry", level_name(sub.ferry)},
            {"transfer", level_name(sub.transfer)},
            {"share", level_name(sub.share)},
            {"throttle", level_name(sub.throttle)},
            {"remote", level_name(sub.remote)},
            {"db", level_name(sub.db)}
        }}
    };
}

} // namespace ferry::config
