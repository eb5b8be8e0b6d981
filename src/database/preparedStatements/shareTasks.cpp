#include "database/DBConnection.hpp"

using namespace ferry::database;

void DBConnection::initPreparedShareTasks() const {
    conn_->prepare("share_task.list_by_account",
                   "SELECT id, fs_id, file_name, file_path, expiry, password_mode, share_password, share_link, "
                   "status, error_message, title, session_tag, order_index, metadata::text AS metadata, created_at "
                   "FROM share_tasks WHERE account = $1 ORDER BY order_index ASC, id ASC");

    conn_->prepare("share_task.insert",
                   "INSERT INTO share_tasks (account, fs_id, file_name, file_path, expiry, password_mode, "
                   "share_password, share_link, status, error_message, title, session_tag, metadata, "
                   "created_at, order_index) "
                   "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13::jsonb, "
                   "  COALESCE(to_timestamp(NULLIF($14::bigint, 0)) AT TIME ZONE 'UTC', NOW() AT TIME ZONE 'UTC'), "
                   "  (SELECT COALESCE(MAX(order_index), -1) + 1 FROM share_tasks WHERE account = $1)) "
                   "RETURNING id");

    conn_->prepare("share_task.update",
                   "UPDATE share_tasks SET "
                   "  status = COALESCE($2, status), "
                   "  error_message = COALESCE($3, error_message), "
                   "  share_link = COALESCE($4, share_link), "
                   "  share_password = COALESCE($5, share_password), "
                   "  updated_at = NOW() AT TIME ZONE 'UTC' "
                   "WHERE id = $1");

    conn_->prepare("share_task.delete", "DELETE FROM share_tasks WHERE id = $1");

    conn_->prepare("share_task.set_order",
                   "UPDATE share_tasks SET order_index = $1, updated_at = NOW() AT TIME ZONE 'UTC' "
                   "WHERE id = $2 AND account = $3");

    conn_->prepare("share_task.clear", "DELETE FROM share_tasks WHERE account = $1");

    conn_->prepare("share_task.clear_by_status",
                   "DELETE FROM share_tasks WHERE account = $1 AND status = $2");
}
