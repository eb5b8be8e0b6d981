#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace ferry::config {

class ConfigRegistry {
public:
    static constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/ferry/config.yaml";

    static void init(const std::filesystem::path& path = DEFAULT_CONFIG_PATH);
    static const Config& get();

    [[nodiscard]] static bool isInitialized() { return initialized_; }

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace ferry::config
