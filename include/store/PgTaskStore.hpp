#pragma once

#include "store/TaskStore.hpp"

namespace ferry::store {

// TaskStore over the transfer_tasks and share_tasks tables. Requires
// database::Transactions::init(); pqxx errors propagate to the caller.
class PgTaskStore final : public TaskStore {
public:
    std::vector<std::shared_ptr<types::TransferTask>> fetchTransferTasks(const std::string& account) override;
    std::vector<std::shared_ptr<types::ShareTask>> fetchShareTasks(const std::string& account) override;

    unsigned int insertTransferTask(const std::string& account, const types::TransferTask& task) override;
    unsigned int insertShareTask(const std::string& account, const types::ShareTask& task) override;

    bool updateTransferTask(unsigned int id, const TransferTaskUpdate& update) override;
    bool updateShareTask(unsigned int id, const ShareTaskUpdate& update) override;

    bool deleteTransferTask(unsigned int id) override;
    bool deleteShareTask(unsigned int id) override;

    bool reorderTransferTasks(const std::string& account, const std::vector<unsigned int>& ids) override;
    bool reorderShareTasks(const std::string& account, const std::vector<unsigned int>& ids) override;

    unsigned int clearTransferTasks(const std::string& account,
                                    const std::optional<types::TaskStatus>& status) override;
    unsigned int clearShareTasks(const std::string& account,
                                 const std::optional<types::TaskStatus>& status) override;
};

} // namespace ferry::store
