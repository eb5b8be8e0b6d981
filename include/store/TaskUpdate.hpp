#pragma once

#include "types/Task.hpp"

#include <optional>
#include <string>

namespace ferry::store {

// Field-change sets. Unset fields keep their stored value.

struct TransferTaskUpdate {
    std::optional<types::TaskStatus> status;
    std::optional<std::string> error_message;
    std::optional<std::string> target_path;
    std::optional<std::string> filename;
    std::optional<bool> auto_share;
};

struct ShareTaskUpdate {
    std::optional<types::TaskStatus> status;
    std::optional<std::string> error_message;
    std::optional<std::string> share_link;
    std::optional<std::string> share_password;
};

} // namespace ferry::store
