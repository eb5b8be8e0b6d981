#include "workers/ShareWorker.hpp"
#include "crypto/password.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <variant>

using namespace ferry::workers;
using namespace ferry::types;
using namespace ferry::concurrency;
using namespace ferry::logging;

ShareWorker::ShareWorker(WorkerDeps<ShareTask> deps, const config::QueueConfig& cfg, PasswordGenerator generator)
    : QueueWorker("ShareWorker", queue::QueueKind::Share, std::move(deps), cfg, LogRegistry::share()),
      generator_(std::move(generator)) {
    if (!generator_) generator_ = [] { return crypto::generateSharePassword(); };
}

ShareWorker::~ShareWorker() {
    stop();
}

std::string ShareWorker::passwordFor(const ShareTask& task) const {
    switch (task.password_mode) {
        case PasswordMode::Fixed: return task.share_password;
        case PasswordMode::Random: return generator_();
        default: return "";
    }
}

void ShareWorker::process(const Claim& claim) {
    const auto& task = claim.copy;

    const auto fsId = task.resolveFileId();
    if (!fsId) throw std::invalid_argument("no file id to share");

    const auto password = passwordFor(task);
    const auto expiry = task.expiry_days;

    std::variant<std::string, int> result;
    {
        const auto lease = acquireLease();
        limiter_->pace();

        const auto client = client_;
        const auto id = *fsId;
        result = runRemoteCall(lease, callDeadline(), [client, id, expiry, password] {
            return client->createShare(id, expiry, password);
        });
    }

    if (const auto* code = std::get_if<int>(&result)) {
        recordRemoteFailure(claim, *code);
        return;
    }

    const auto link = std::get<std::string>(result);
    const auto done = commit(claim, [&](ShareTask& t) {
        t.status = TaskStatus::Completed;
        t.error_message.clear();
        t.share_link = link;
        t.share_password = password;
    });

    const auto line = fmt::format("share succeeded #{}: title='{}', file='{}', link={}",
                                  claim.index, done.title, done.displayName(), link);
    log_->info("[ShareWorker] {}", line);

    queue::WorkerEvent event;
    event.type = queue::WorkerEvent::Type::Completed;
    event.index = claim.index;
    event.status = TaskStatus::Completed;
    event.message = line;
    event.share = done;
    publishEvent(std::move(event));

    limiter_->onSuccess();
}

void ShareWorker::persist(const unsigned int id, const ShareTask& task) {
    store::ShareTaskUpdate update;
    update.status = task.status;
    update.error_message = task.error_message;
    if (task.status == TaskStatus::Completed) {
        update.share_link = task.share_link;
        update.share_password = task.share_password;
    }

    if (!store_->updateShareTask(id, update))
        log_->debug("[ShareWorker] No stored row for share task {}", id);
}

std::string ShareWorker::faultMessage(const ShareTask& task, const std::string& what) const {
    const auto name = task.file_info && !task.file_info->name.empty() ? task.file_info->name : "N/A";
    return fmt::format("share error: {}\nfile: {}", what, name);
}
