#include "database/DBConnection.hpp"

using namespace ferry::database;

void DBConnection::initPreparedTransferTasks() const {
    conn_->prepare("transfer_task.list_by_account",
                   "SELECT id, share_link, share_password, target_path, status, error_message, filename, title, "
                   "session_tag, auto_share, order_index, metadata::text AS metadata, created_at "
                   "FROM transfer_tasks WHERE account = $1 ORDER BY order_index ASC, id ASC");

    conn_->prepare("transfer_task.insert",
                   "INSERT INTO transfer_tasks (account, share_link, share_password, target_path, status, "
                   "error_message, filename, title, session_tag, auto_share, metadata, created_at, order_index) "
                   "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11::jsonb, "
                   "  COALESCE(to_timestamp(NULLIF($12::bigint, 0)) AT TIME ZONE 'UTC', NOW() AT TIME ZONE 'UTC'), "
                   "  (SELECT COALESCE(MAX(order_index), -1) + 1 FROM transfer_tasks WHERE account = $1)) "
                   "RETURNING id");

    conn_->prepare("transfer_task.update",
                   "UPDATE transfer_tasks SET "
                   "  status = COALESCE($2, status), "
                   "  error_message = COALESCE($3, error_message), "
                   "  target_path = COALESCE($4, target_path), "
                   "  filename = COALESCE($5, filename), "
                   "  auto_share = COALESCE($6, auto_share), "
                   "  updated_at = NOW() AT TIME ZONE 'UTC' "
                   "WHERE id = $1");

    conn_->prepare("transfer_task.delete", "DELETE FROM transfer_tasks WHERE id = $1");

    conn_->prepare("transfer_task.set_order",
                   "UPDATE transfer_tasks SET order_index = $1, updated_at = NOW() AT TIME ZONE 'UTC' "
                   "WHERE id = $2 AND account = $3");

    conn_->prepare("transfer_task.clear", "DELETE FROM transfer_tasks WHERE account = $1");

    conn_->prepare("transfer_task.clear_by_status",
                   "DELETE FROM transfer_tasks WHERE account = $1 AND status = $2");
}
