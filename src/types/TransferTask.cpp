#include "types/TransferTask.hpp"

#include <nlohmann/json.hpp>

using namespace ferry::types;

TransferTask::TransferTask(std::string link, std::string password, std::string targetPath)
    : share_link(std::move(link)),
      share_password(std::move(password)),
      target_path(std::move(targetPath)) {}

void ferry::types::to_json(nlohmann::json& j, const TransferTask& t) {
    j = nlohmann::json::object();
    task_base_to_json(j, t);
    j["share_link"] = t.share_link;
    j["share_password"] = t.share_password;
    j["target_path"] = t.target_path;
    j["filename"] = t.filename;
    j["auto_share"] = t.auto_share;
}

void ferry::types::from_json(const nlohmann::json& j, TransferTask& t) {
    task_base_from_json(j, t);
    t.share_link = j.at("share_link").get<std::string>();
    t.share_password = j.value("share_password", std::string{});
    t.target_path = j.value("target_path", std::string{});
    t.filename = j.value("filename", std::string{});
    t.auto_share = j.value("auto_share", false);
}
