#include "workers/TransferWorker.hpp"
#include "logging/LogRegistry.hpp"
#include "util/link.hpp"

#include <stdexcept>

using namespace ferry::workers;
using namespace ferry::types;
using namespace ferry::concurrency;
using namespace ferry::logging;

TransferWorker::TransferWorker(WorkerDeps<TransferTask> deps, const config::QueueConfig& cfg)
    : QueueWorker("TransferWorker", queue::QueueKind::Transfer, std::move(deps), cfg, LogRegistry::transfer()) {}

TransferWorker::~TransferWorker() {
    stop();
}

void TransferWorker::process(const Claim& claim) {
    const auto& task = claim.copy;
    if (task.share_link.empty()) throw std::invalid_argument("share link is empty");

    const auto split = util::splitAccessCode(task.share_link);
    const auto baseUrl = split.base;
    const auto code = split.code.empty() ? task.share_password : split.code;
    const auto targetPath = task.target_path;

    int result;
    std::optional<std::string> filename;

    {
        const auto lease = acquireLease();
        const auto client = client_;
        const auto log = log_;

        // Filename lookup is best effort and never blocks the transfer.
        filename = runRemoteCall(lease, callDeadline(), [client, log, baseUrl, code]() -> std::optional<std::string> {
            try {
                if (!code.empty() && !client->verifyAccessCode(baseUrl, code))
                    log->debug("[TransferWorker] Access code not accepted during lookup for {}", baseUrl);
                return client->resolveShareFilename(baseUrl);
            } catch (const std::exception& e) {
                log->debug("[TransferWorker] Filename lookup failed for {}: {}", baseUrl, e.what());
                return std::nullopt;
            }
        });

        limiter_->pace();

        result = runRemoteCall(lease, callDeadline(), [client, baseUrl, code, targetPath] {
            return client->transfer(baseUrl, code, targetPath);
        });
    }

    if (result != remote::kSuccess) {
        recordRemoteFailure(claim, result);
        return;
    }

    const auto done = commit(claim, [&](TransferTask& t) {
        t.status = TaskStatus::Completed;
        t.error_message.clear();
        t.target_path = targetPath;
        if (filename) t.filename = *filename;
    });

    const auto line = fmt::format("transfer succeeded #{}: title='{}', filename='{}', target={}",
                                  claim.index, done.title, done.filename, done.target_path);
    log_->info("[TransferWorker] {}", line);

    queue::WorkerEvent event;
    event.type = queue::WorkerEvent::Type::Completed;
    event.index = claim.index;
    event.status = TaskStatus::Completed;
    event.message = line;
    event.transfer = done;
    publishEvent(std::move(event));

    limiter_->onSuccess();
}

void TransferWorker::persist(const unsigned int id, const TransferTask& task) {
    store::TransferTaskUpdate update;
    update.status = task.status;
    update.error_message = task.error_message;
    update.target_path = task.target_path;
    if (!task.filename.empty()) update.filename = task.filename;

    if (!store_->updateTransferTask(id, update))
        log_->debug("[TransferWorker] No stored row for transfer task {}", id);
}

std::string TransferWorker::faultMessage(const TransferTask& task, const std::string& what) const {
    return fmt::format("transfer error: {}\nlink: {}\ntarget: {}",
                       what,
                       task.share_link.empty() ? "N/A" : task.share_link,
                       task.target_path.empty() ? "N/A" : task.target_path);
}
