#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace ferry::config {

struct ThrottleConfig {
    unsigned int jitter_ms_min = 500;
    unsigned int jitter_ms_max = 1500;
    unsigned int ops_per_window = 50;
    unsigned int window_sec = 60;
    unsigned int window_rest_sec = 20;
    unsigned int max_consecutive_failures = 5;
    unsigned int pause_sec_on_failure = 60;
    unsigned int cooldown_on_too_many_accesses_sec = 120;
    double backoff_factor = 1.5; // carried for config compatibility, not applied
};

struct QueueConfig {
    std::string default_target_path = "/batch-transfer";
    unsigned int default_share_expiry_days = 7;
    unsigned int idle_poll_ms = 500;
    unsigned int pause_poll_ms = 100;
    unsigned int remote_call_timeout_ms = 0; // 0 disables call deadlines
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "ferry";
    std::string user = "ferry";
    std::string password;
    unsigned int pool_size = 4;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum ferry    = spdlog::level::info;  // lifecycle, imports, chaining
    spdlog::level::level_enum transfer = spdlog::level::info;
    spdlog::level::level_enum share    = spdlog::level::info;
    spdlog::level::level_enum throttle = spdlog::level::warn;  // only surfaces cooldowns and pauses
    spdlog::level::level_enum remote   = spdlog::level::warn;
    spdlog::level::level_enum db       = spdlog::level::err;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/ferry";
    LogLevelsConfig levels;
};

struct Config {
    ThrottleConfig throttle;
    QueueConfig queue;
    DatabaseConfig database;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const ThrottleConfig& c);
void from_json(const nlohmann::json& j, ThrottleConfig& c);
void to_json(nlohmann::json& j, const QueueConfig& c);
void from_json(const nlohmann::json& j, QueueConfig& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void from_json(const nlohmann::json& j, DatabaseConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

} // namespace ferry::config
