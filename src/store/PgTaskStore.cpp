#include "store/PgTaskStore.hpp"
#include "database/Transactions.hpp"
#include "util/timestamp.hpp"

#include <pqxx/pqxx>

using namespace ferry::store;
using namespace ferry::types;
using namespace ferry::database;

namespace {

std::optional<std::string> status_param(const std::optional<TaskStatus>& status) {
    if (!status) return std::nullopt;
    return to_string(*status);
}

nlohmann::json metadata_from_row(const pqxx::row& row) {
    if (row["metadata"].is_null()) return nlohmann::json::object();
    auto j = nlohmann::json::parse(row["metadata"].as<std::string>(), nullptr, false);
    return j.is_object() ? j : nlohmann::json::object();
}

void task_base_from_row(const pqxx::row& row, Task& t) {
    t.id = row["id"].as<unsigned int>();
    t.status = to_task_status(row["status"].as<std::string>());
    t.error_message = row["error_message"].as<std::string>();
    t.title = row["title"].as<std::string>();
    t.session_tag = row["session_tag"].as<std::string>();
    t.order_index = row["order_index"].as<int>();
    t.created_at = ferry::util::parsePostgresTimestamp(row["created_at"].as<std::string>());
    t.metadata = metadata_from_row(row);
}

std::shared_ptr<TransferTask> transfer_task_from_row(const pqxx::row& row) {
    auto t = std::make_shared<TransferTask>();
    task_base_from_row(row, *t);
    t->share_link = row["share_link"].as<std::string>();
    t->share_password = row["share_password"].as<std::string>();
    t->target_path = row["target_path"].as<std::string>();
    t->filename = row["filename"].as<std::string>();
    t->auto_share = row["auto_share"].as<bool>();
    return t;
}

std::shared_ptr<ShareTask> share_task_from_row(const pqxx::row& row) {
    auto t = std::make_shared<ShareTask>();
    task_base_from_row(row, *t);
    t->file_path = row["file_path"].as<std::string>();
    t->expiry_days = row["expiry"].as<unsigned int>();
    t->password_mode = to_password_mode(row["password_mode"].as<std::string>());
    t->share_password = row["share_password"].as<std::string>();
    t->share_link = row["share_link"].as<std::string>();

    if (!row["fs_id"].is_null()) {
        t->fs_id = row["fs_id"].as<std::uint64_t>();
        auto name = row["file_name"].as<std::string>();
        if (name.empty()) name = t->title;
        t->file_info = FileInfo{*t->fs_id, name, t->file_path};
    }
    return t;
}

} // namespace

std::vector<std::shared_ptr<TransferTask>> PgTaskStore::fetchTransferTasks(const std::string& account) {
    return Transactions::exec("PgTaskStore::fetchTransferTasks", [&](pqxx::work& txn) {
        std::vector<std::shared_ptr<TransferTask>> tasks;
        for (const auto& row : txn.exec(pqxx::prepped{"transfer_task.list_by_account"}, pqxx::params{account}))
            tasks.push_back(transfer_task_from_row(row));
        return tasks;
    });
}

std::vector<std::shared_ptr<ShareTask>> PgTaskStore::fetchShareTasks(const std::string& account) {
    return Transactions::exec("PgTaskStore::fetchShareTasks", [&](pqxx::work& txn) {
        std::vector<std::shared_ptr<ShareTask>> tasks;
        for (const auto& row : txn.exec(pqxx::prepped{"share_task.list_by_account"}, pqxx::params{account}))
            tasks.push_back(share_task_from_row(row));
        return tasks;
    });
}

unsigned int PgTaskStore::insertTransferTask(const std::string& account, const TransferTask& task) {
    return Transactions::exec("PgTaskStore::insertTransferTask", [&](pqxx::work& txn) {
        pqxx::params p{
            account,
            task.share_link,
            task.share_password,
            task.target_path,
            to_string(task.status),
            task.error_message,
            task.filename,
            task.title,
            task.session_tag,
            task.auto_share,
            task.metadata.dump(),
            static_cast<long long>(task.created_at)
        };
        return txn.exec(pqxx::prepped{"transfer_task.insert"}, p).one_field().as<unsigned int>();
    });
}

unsigned int PgTaskStore::insertShareTask(const std::string& account, const ShareTask& task) {
    return Transactions::exec("PgTaskStore::insertShareTask", [&](pqxx::work& txn) {
        const auto fsId = task.resolveFileId();
        pqxx::params p{
            account,
            fsId ? std::optional<long long>(static_cast<long long>(*fsId)) : std::nullopt,
            task.file_info ? task.file_info->name : std::string{},
            task.file_path.empty() && task.file_info ? task.file_info->path : task.file_path,
            task.expiry_days,
            to_string(task.password_mode),
            task.share_password,
            task.share_link,
            to_string(task.status),
            task.error_message,
            task.title,
            task.session_tag,
            task.metadata.dump(),
            static_cast<long long>(task.created_at)
        };
        return txn.exec(pqxx::prepped{"share_task.insert"}, p).one_field().as<unsigned int>();
    });
}

bool PgTaskStore::updateTransferTask(const unsigned int id, const TransferTaskUpdate& update) {
    return Transactions::exec("PgTaskStore::updateTransferTask", [&](pqxx::work& txn) {
        pqxx::params p{
            id,
            status_param(update.status),
            update.error_message,
            update.target_path,
            update.filename,
            update.auto_share
        };
        return txn.exec(pqxx::prepped{"transfer_task.update"}, p).affected_rows() > 0;
    });
}

bool PgTaskStore::updateShareTask(const unsigned int id, const ShareTaskUpdate& update) {
    return Transactions::exec("PgTaskStore::updateShareTask", [&](pqxx::work& txn) {
        pqxx::params p{
            id,
            status_param(update.status),
            update.error_message,
            update.share_link,
            update.share_password
        };
        return txn.exec(pqxx::prepped{"share_task.update"}, p).affected_rows() > 0;
    });
}

bool PgTaskStore::deleteTransferTask(const unsigned int id) {
    return Transactions::exec("PgTaskStore::deleteTransferTask", [&](pqxx::work& txn) {
        return txn.exec(pqxx::prepped{"transfer_task.delete"}, pqxx::params{id}).affected_rows() > 0;
    });
}

bool PgTaskStore::deleteShareTask(const unsigned int id) {
    return Transactions::exec("PgTaskStore::deleteShareTask", [&](pqxx::work& txn) {
        return txn.exec(pqxx::prepped{"share_task.delete"}, pqxx::params{id}).affected_rows() > 0;
    });
}

bool PgTaskStore::reorderTransferTasks(const std::string& account, const std::vector<unsigned int>& ids) {
    Transactions::exec("PgTaskStore::reorderTransferTasks", [&](pqxx::work& txn) {
        for (std::size_t i = 0; i < ids.size(); ++i)
            txn.exec(pqxx::prepped{"transfer_task.set_order"}, pqxx::params{static_cast<int>(i), ids[i], account});
    });
    return true;
}

bool PgTaskStore::reorderShareTasks(const std::string& account, const std::vector<unsigned int>& ids) {
    Transactions::exec("PgTaskStore::reorderShareTasks", [&](pqxx::work& txn) {
        for (std::size_t i = 0; i < ids.size(); ++i)
            txn.exec(pqxx::prepped{"share_task.set_order"}, pqxx::params{static_cast<int>(i), ids[i], account});
    });
    return true;
}

unsigned int PgTaskStore::clearTransferTasks(const std::string& account, const std::optional<TaskStatus>& status) {
    return Transactions::exec("PgTaskStore::clearTransferTasks", [&](pqxx::work& txn) {
        const auto res = status
            ? txn.exec(pqxx::prepped{"transfer_task.clear_by_status"}, pqxx::params{account, to_string(*status)})
            : txn.exec(pqxx::prepped{"transfer_task.clear"}, pqxx::params{account});
        return static_cast<unsigned int>(res.affected_rows());
    });
}

unsigned int PgTaskStore::clearShareTasks(const std::string& account, const std::optional<TaskStatus>& status) {
    return Transactions::exec("PgTaskStore::clearShareTasks", [&](pqxx::work& txn) {
        const auto res = status
            ? txn.exec(pqxx::prepped{"share_task.clear_by_status"}, pqxx::params{account, to_string(*status)})
            : txn.exec(pqxx::prepped{"share_task.clear"}, pqxx::params{account});
        return static_cast<unsigned int>(res.affected_rows());
    });
}
