#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ferry::config;

template<>
struct convert<ThrottleConfig> {
    static Node encode(const ThrottleConfig& rhs) {
        Node node;
        node["jitter_ms_min"] = rhs.jitter_ms_min;
        node["jitter_ms_max"] = rhs.jitter_ms_max;
        node["ops_per_window"] = rhs.ops_per_window;
        node["window_sec"] = rhs.window_sec;
        node["window_rest_sec"] = rhs.window_rest_sec;
        node["max_consecutive_failures"] = rhs.max_consecutive_failures;
        node["pause_sec_on_failure"] = rhs.pause_sec_on_failure;
        node["cooldown_on_too_many_accesses_sec"] = rhs.cooldown_on_too_many_accesses_sec;
        node["backoff_factor"] = rhs.backoff_factor;
        return node;
    }

    static bool decode(const Node& node, ThrottleConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.jitter_ms_min = node["jitter_ms_min"].as<unsigned int>(500);
        rhs.jitter_ms_max = node["jitter_ms_max"].as<unsigned int>(1500);
        rhs.ops_per_window = node["ops_per_window"].as<unsigned int>(50);
        rhs.window_sec = node["window_sec"].as<unsigned int>(60);
        rhs.window_rest_sec = node["window_rest_sec"].as<unsigned int>(20);
        rhs.max_consecutive_failures = node["max_consecutive_failures"].as<unsigned int>(5);
        rhs.pause_sec_on_failure = node["pause_sec_on_failure"].as<unsigned int>(60);
        rhs.cooldown_on_too_many_accesses_sec = node["cooldown_on_too_many_accesses_sec"].as<unsigned int>(120);
        rhs.backoff_factor = node["backoff_factor"].as<double>(1.5);
        return true;
    }
};

template<>
struct convert<QueueConfig> {
    static Node encode(const QueueConfig& rhs) {
        Node node;
        node["default_target_path"] = rhs.default_target_path;
        node["default_share_expiry_days"] = rhs.default_share_expiry_days;
        node["idle_poll_ms"] = rhs.idle_poll_ms;
        node["pause_poll_ms"] = rhs.pause_poll_ms;
        node["remote_call_timeout_ms"] = rhs.remote_call_timeout_ms;
        return node;
    }

    static bool decode(const Node& node, QueueConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.default_target_path = node["default_target_path"].as<std::string>("/batch-transfer");
        rhs.default_share_expiry_days = node["default_share_expiry_days"].as<unsigned int>(7);
        rhs.idle_poll_ms = node["idle_poll_ms"].as<unsigned int>(500);
        rhs.pause_poll_ms = node["pause_poll_ms"].as<unsigned int>(100);
        rhs.remote_call_timeout_ms = node["remote_call_timeout_ms"].as<unsigned int>(0);
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("ferry");
        rhs.user = node["user"].as<std::string>("ferry");
        rhs.password = node["password"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<unsigned int>(4);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["ferry"]    = to_std_string(spdlog::level::to_string_view(rhs.ferry));
        node["transfer"] = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        node["share"]    = to_std_string(spdlog::level::to_string_view(rhs.share));
        node["throttle"] = to_std_string(spdlog::level::to_string_view(rhs.throttle));
        node["remote"]   = to_std_string(spdlog::level::to_string_view(rhs.remote));
        node["db"]       = to_std_string(spdlog::level::to_string_view(rhs.db));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.ferry = spdlog::level::from_str(node["ferry"].as<std::string>("info"));
        rhs.transfer = spdlog::level::from_str(node["transfer"].as<std::string>("info"));
        rhs.share = spdlog::level::from_str(node["share"].as<std::string>("info"));
        rhs.throttle = spdlog::level::from_str(node["throttle"].as<std::string>("warn"));
        rhs.remote = spdlog::level::from_str(node["remote"].as<std::string>("warn"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("err"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/ferry");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
