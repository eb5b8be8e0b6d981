#include "types/ShareTask.hpp"

#include <nlohmann/json.hpp>

using namespace ferry::types;

std::string ferry::types::to_string(const PasswordMode& mode) {
    switch (mode) {
        case PasswordMode::Random: return "random";
        case PasswordMode::Fixed: return "fixed";
        case PasswordMode::None: return "none";
        default: return "none";
    }
}

PasswordMode ferry::types::to_password_mode(const std::string& str) {
    if (str == "random") return PasswordMode::Random;
    if (str == "fixed") return PasswordMode::Fixed;
    return PasswordMode::None;
}

std::optional<std::uint64_t> ShareTask::resolveFileId() const {
    if (fs_id) return fs_id;
    if (file_info) return file_info->fs_id;
    return std::nullopt;
}

std::string ShareTask::displayName() const {
    if (file_info && !file_info->name.empty()) return file_info->name;
    if (!file_path.empty()) {
        const auto pos = file_path.find_last_of('/');
        return pos == std::string::npos ? file_path : file_path.substr(pos + 1);
    }
    return title;
}

void ferry::types::to_json(nlohmann::json& j, const FileInfo& f) {
    j = nlohmann::json{
        {"fs_id", f.fs_id},
        {"name", f.name},
        {"path", f.path}
    };
}

void ferry::types::from_json(const nlohmann::json& j, FileInfo& f) {
    f.fs_id = j.at("fs_id").get<std::uint64_t>();
    f.name = j.value("name", std::string{});
    f.path = j.value("path", std::string{});
}

void ferry::types::to_json(nlohmann::json& j, const ShareTask& t) {
    j = nlohmann::json::object();
    task_base_to_json(j, t);
    j["fs_id"] = t.fs_id ? nlohmann::json(*t.fs_id) : nlohmann::json(nullptr);
    j["file_info"] = t.file_info ? nlohmann::json(*t.file_info) : nlohmann::json(nullptr);
    j["file_path"] = t.file_path;
    j["expiry"] = t.expiry_days;
    j["password_mode"] = to_string(t.password_mode);
    j["share_password"] = t.share_password;
    j["share_link"] = t.share_link;
}

void ferry::types::from_json(const nlohmann::json& j, ShareTask& t) {
    task_base_from_json(j, t);
    if (j.contains("fs_id") && !j["fs_id"].is_null()) t.fs_id = j.at("fs_id").get<std::uint64_t>();
    else t.fs_id.reset();
    if (j.contains("file_info") && j["file_info"].is_object()) t.file_info = j.at("file_info").get<FileInfo>();
    else t.file_info.reset();
    t.file_path = j.value("file_path", std::string{});
    t.expiry_days = j.value("expiry", 7u);
    t.password_mode = to_password_mode(j.value("password_mode", std::string("random")));
    t.share_password = j.value("share_password", std::string{});
    t.share_link = j.value("share_link", std::string{});
}
