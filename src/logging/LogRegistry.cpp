#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <stdexcept>
#include <utility>

namespace ferry::logging {

void LogRegistry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] init() called twice, keeping existing loggers");
        return;
    }

    std::filesystem::create_directories(logDir);
    log_dir_ = logDir;
    main_log_path_ = logDir / "ferry.log";

    const auto& levels = config::ConfigRegistry::get().logging.levels;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(levels.console_log_level);
    console_sink_->set_pattern(LOG_FORMAT);

    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    const auto& sub = levels.subsystem_levels;
    const std::pair<const char*, spdlog::level::level_enum> subsystems[] = {
        {"ferry", sub.ferry},
        {"transfer", sub.transfer},
        {"share", sub.share},
        {"throttle", sub.throttle},
        {"remote", sub.remote},
        {"db", sub.db},
    };

    for (const auto& [name, level] : subsystems) {
        auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(std::move(logger));
    }

    initialized_ = true;
    ferry()->debug("[LogRegistry] Writing to {}", main_log_path_.string());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    if (auto logger = spdlog::get(name)) return logger;
    if (!initialized_) throw std::runtime_error("[LogRegistry] get(\"" + name + "\") before init()");
    throw std::runtime_error("[LogRegistry] No logger named " + name);
}

bool LogRegistry::isInitialized() { return initialized_; }

} // namespace ferry::logging
