#pragma once

#include "types/Task.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ferry::types {

enum class PasswordMode { Random, Fixed, None };

std::string to_string(const PasswordMode& mode);

// Unknown strings map to None: the share is created without an access code.
PasswordMode to_password_mode(const std::string& str);

struct FileInfo {
    std::uint64_t fs_id{};
    std::string name;
    std::string path;
};

struct ShareTask : Task {
    std::optional<std::uint64_t> fs_id;
    std::optional<FileInfo> file_info;
    std::string file_path;
    unsigned int expiry_days{7}; // 0 = permanent
    PasswordMode password_mode{PasswordMode::Random};
    std::string share_password;
    std::string share_link;

    // fs_id if set, otherwise the id nested in file_info.
    [[nodiscard]] std::optional<std::uint64_t> resolveFileId() const;

    // file_info name, otherwise the last path component, otherwise the title.
    [[nodiscard]] std::string displayName() const;
};

void to_json(nlohmann::json& j, const FileInfo& f);
void from_json(const nlohmann::json& j, FileInfo& f);
void to_json(nlohmann::json& j, const ShareTask& t);
void from_json(const nlohmann::json& j, ShareTask& t);

} // namespace ferry::types
