#pragma once

#include "store/TaskUpdate.hpp"
#include "types/ShareTask.hpp"
#include "types/TransferTask.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ferry::store {

// Durable task CRUD scoped by account. Every method may throw on a storage
// fault; callers decide whether that is fatal.
class TaskStore {
public:
    virtual ~TaskStore() = default;

    // Tasks in stored order (order_index, then id).
    virtual std::vector<std::shared_ptr<types::TransferTask>> fetchTransferTasks(const std::string& account) = 0;
    virtual std::vector<std::shared_ptr<types::ShareTask>> fetchShareTasks(const std::string& account) = 0;

    // Appends at the end of the account's order and returns the new id.
    virtual unsigned int insertTransferTask(const std::string& account, const types::TransferTask& task) = 0;
    virtual unsigned int insertShareTask(const std::string& account, const types::ShareTask& task) = 0;

    // False when no row matched.
    virtual bool updateTransferTask(unsigned int id, const TransferTaskUpdate& update) = 0;
    virtual bool updateShareTask(unsigned int id, const ShareTaskUpdate& update) = 0;

    virtual bool deleteTransferTask(unsigned int id) = 0;
    virtual bool deleteShareTask(unsigned int id) = 0;

    // Rewrites order_index to each id's position in ids. Unlisted rows are left alone.
    virtual bool reorderTransferTasks(const std::string& account, const std::vector<unsigned int>& ids) = 0;
    virtual bool reorderShareTasks(const std::string& account, const std::vector<unsigned int>& ids) = 0;

    virtual unsigned int clearTransferTasks(const std::string& account,
                                            const std::optional<types::TaskStatus>& status) = 0;
    virtual unsigned int clearShareTasks(const std::string& account,
                                         const std::optional<types::TaskStatus>& status) = 0;
};

} // namespace ferry::store
