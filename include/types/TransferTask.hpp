#pragma once

#include "types/Task.hpp"

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ferry::types {

struct TransferTask : Task {
    std::string share_link;
    std::string share_password;
    std::string target_path;
    std::string filename; // resolved remote filename, known once the transfer ran
    bool auto_share{false};

    TransferTask() = default;
    TransferTask(std::string link, std::string password, std::string targetPath);
};

void to_json(nlohmann::json& j, const TransferTask& t);
void from_json(const nlohmann::json& j, TransferTask& t);

} // namespace ferry::types
