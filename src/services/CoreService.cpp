#include "services/CoreService.hpp"
#include "services/EventDispatcher.hpp"
#include "services/QueueObserver.hpp"
#include "concurrency/ExecutionLock.hpp"
#include "concurrency/RateLimiter.hpp"
#include "concurrency/RemoteCall.hpp"
#include "store/TaskStore.hpp"
#include "workers/ShareWorker.hpp"
#include "workers/TransferWorker.hpp"
#include "remote/ErrorCodes.hpp"
#include "logging/LogRegistry.hpp"
#include "util/link.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>
#include <fmt/format.h>

using namespace ferry::services;
using namespace ferry::types;
using namespace ferry::queue;
using namespace ferry::concurrency;
using namespace ferry::logging;

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

CoreService::CoreService(CoreServiceDeps deps, std::string account, const config::Config& cfg)
    : cfg_(cfg),
      account_(std::move(account)),
      sessionTag_(util::makeSessionTag()),
      client_(std::move(deps.client)),
      store_(std::move(deps.store)),
      limiter_(std::move(deps.limiter)),
      executionLock_(std::move(deps.executionLock)),
      transferQueue_(std::make_shared<TaskQueue<TransferTask>>()),
      shareQueue_(std::make_shared<TaskQueue<ShareTask>>()),
      events_(std::make_shared<EventChannel>()),
      dispatchEvents_(deps.dispatchEvents) {
    if (!client_) throw std::invalid_argument("CoreService requires a remote client");
    if (!limiter_) limiter_ = std::make_shared<RateLimiter>(cfg_.throttle);
    if (!executionLock_) executionLock_ = std::make_shared<SerialExecutionLock>();

    if (dispatchEvents_) {
        dispatcher_ = std::make_unique<EventDispatcher>(
            *events_, [this](const WorkerEvent& event) {
                std::scoped_lock lock(dispatchMutex_);
                handleEvent(event);
            },
            std::chrono::milliseconds(cfg_.queue.idle_poll_ms));
        dispatcher_->start();
    }

    LogRegistry::ferry()->info("[CoreService] Created for account '{}' (session {})", account_, sessionTag_);
}

CoreService::~CoreService() {
    {
        std::scoped_lock lock(lifecycleMutex_);
        if (transferWorker_) transferWorker_->requestStop();
        if (shareWorker_) shareWorker_->requestStop();
        for (const auto& w : retired_) w->requestStop();
    }

    // Joining waits out any task still under the execution lock.
    transferWorker_.reset();
    shareWorker_.reset();
    retired_.clear();

    if (dispatcher_) dispatcher_->stop();
    dispatcher_.reset();

    LogRegistry::ferry()->info("[CoreService] Shut down (session {})", sessionTag_);
}

StartResult CoreService::login(const std::string& sessionToken) {
    try {
        if (!client_->authenticate(sessionToken)) {
            authenticated_.store(false);
            const std::string msg = "login failed: session token invalid or expired";
            LogRegistry::remote()->warn("[CoreService] {}", msg);
            announce(msg);
            return {false, msg};
        }
    } catch (const std::exception& e) {
        authenticated_.store(false);
        const auto msg = fmt::format("login error: {}", e.what());
        LogRegistry::remote()->error("[CoreService] {}", msg);
        announce(msg);
        return {false, msg};
    }

    authenticated_.store(true);
    announce("login succeeded");

    if (hasAccount()) hydrate();
    return {true, ""};
}

void CoreService::hydrate() {
    try {
        auto transfers = store_->fetchTransferTasks(account_);
        auto shares = store_->fetchShareTasks(account_);

        // No worker owns a task from a previous process.
        for (const auto& t : transfers)
            if (t->status == TaskStatus::Running) t->status = TaskStatus::Pending;
        for (const auto& t : shares)
            if (t->status == TaskStatus::Running) t->status = TaskStatus::Pending;

        const auto transferCount = transfers.size();
        const auto shareCount = shares.size();
        transferQueue_->replaceAll(std::move(transfers));
        shareQueue_->replaceAll(std::move(shares));

        announce(fmt::format("loaded queues from store: {} transfer tasks, {} share tasks",
                             transferCount, shareCount));
    } catch (const std::exception& e) {
        LogRegistry::db()->error("[CoreService] Failed to load queues for '{}': {}", account_, e.what());
        announce(fmt::format("failed to load queues: {}", e.what()));
    }
}

void CoreService::persistNew(TransferTask& task) {
    if (!hasAccount()) return;
    try {
        task.id = store_->insertTransferTask(account_, task);
    } catch (const std::exception& e) {
        LogRegistry::db()->error("[CoreService] Failed to store transfer task for {}: {}", task.share_link, e.what());
    }
}

void CoreService::persistNew(ShareTask& task) {
    if (!hasAccount()) return;
    try {
        task.id = store_->insertShareTask(account_, task);
    } catch (const std::exception& e) {
        LogRegistry::db()->error("[CoreService] Failed to store share task '{}': {}", task.displayName(), e.what());
    }
}

int CoreService::addTransferTasks(const std::vector<TransferImportRow>& rows,
                                  const std::string& defaultTargetPath,
                                  const bool autoShare) {
    int imported = 0;
    for (const auto& row : rows) {
        const auto link = trim(row.link);
        if (link.empty()) continue;

        auto password = trim(row.password);
        if (password.empty()) password = util::splitAccessCode(link).code;

        const auto target = trim(row.target_path);
        auto task = std::make_shared<TransferTask>(link, password, target.empty() ? defaultTargetPath : target);
        task->title = trim(row.title);
        task->auto_share = autoShare;
        task->created_at = util::now();
        task->session_tag = sessionTag_;

        persistNew(*task);
        transferQueue_->append(task);
        ++imported;

        LogRegistry::ferry()->debug("[CoreService] Imported #{}: title='{}', link={}, auto_share={}",
                                    imported, task->title, link, autoShare);
    }

    announce(fmt::format("imported {} transfer tasks", imported));
    return imported;
}

bool CoreService::addTransferTask(const std::string& link, const std::string& password, const std::string& targetPath) {
    const auto trimmed = trim(link);
    if (trimmed.empty()) return false;

    const auto code = password.empty() ? util::splitAccessCode(trimmed).code : password;
    auto task = std::make_shared<TransferTask>(trimmed, code,
                                               targetPath.empty() ? cfg_.queue.default_target_path : targetPath);
    task->created_at = util::now();
    task->session_tag = sessionTag_;

    persistNew(*task);
    transferQueue_->append(task);

    announce(fmt::format("added transfer task: {}", trimmed));
    return true;
}

int CoreService::addShareTasksFromPath(const std::string& path, const unsigned int expiryDays,
                                       const std::optional<std::string>& password) {
    if (!isAuthenticated()) {
        announce("add share tasks refused: not logged in");
        return 0;
    }

    const auto listing = listDirectory(path);
    if (const auto* code = std::get_if<int>(&listing)) {
        announce(fmt::format("listing {} failed (code {}): {}", path, *code, remote::describe(*code)));
        return 0;
    }

    // Completed transfers lend their titles to the files they produced.
    std::unordered_map<std::string, std::string> titles;
    for (const auto& t : transferQueue_->snapshot())
        if (t.status == TaskStatus::Completed && !t.filename.empty() && !t.title.empty())
            titles[t.filename] = t.title;

    const bool fixed = password && !password->empty();

    int added = 0;
    for (const auto& entry : std::get<std::vector<remote::RemoteEntry>>(listing)) {
        auto task = std::make_shared<ShareTask>();
        const auto it = titles.find(entry.server_filename);
        task->title = it != titles.end() ? it->second : entry.server_filename;
        task->fs_id = entry.fs_id;
        task->file_info = FileInfo{entry.fs_id, entry.server_filename, entry.path};
        task->file_path = entry.path;
        task->expiry_days = expiryDays;
        task->password_mode = fixed ? PasswordMode::Fixed : PasswordMode::Random;
        task->share_password = fixed ? *password : "";
        task->created_at = util::now();
        task->session_tag = sessionTag_;

        persistNew(*task);
        shareQueue_->append(task);
        ++added;
    }

    announce(fmt::format("added {} share tasks from {} (expiry {} days, {} access code)",
                         added, path, expiryDays, fixed ? "fixed" : "random"));
    return added;
}

StartResult CoreService::startTransfer() {
    std::scoped_lock lock(lifecycleMutex_);
    reapRetired();

    if (!isAuthenticated()) return {false, "not logged in"};
    if (transferWorker_ && transferWorker_->isRunning()) return {false, "transfer worker already running"};

    transferWorker_ = std::make_unique<workers::TransferWorker>(
        workers::WorkerDeps<TransferTask>{transferQueue_, client_, limiter_, executionLock_,
                                          hasAccount() ? store_ : nullptr, events_},
        cfg_.queue);
    transferWorker_->start();

    announce("transfer worker started");
    return {true, ""};
}

void CoreService::pauseTransfer() {
    std::scoped_lock lock(lifecycleMutex_);
    if (!transferWorker_) return;
    transferWorker_->pause();
    announce("transfer paused");
}

void CoreService::resumeTransfer() {
    std::scoped_lock lock(lifecycleMutex_);
    if (!transferWorker_) return;
    transferWorker_->resume();
    announce("transfer resumed");
}

void CoreService::stopTransfer() {
    std::scoped_lock lock(lifecycleMutex_);
    if (!transferWorker_) return;
    transferWorker_->requestStop();
    retired_.push_back(std::move(transferWorker_));
    announce("transfer stopped");
}

StartResult CoreService::startShare() {
    std::scoped_lock lock(lifecycleMutex_);
    reapRetired();

    if (!isAuthenticated()) return {false, "not logged in"};
    if (shareWorker_ && shareWorker_->isRunning()) return {false, "share worker already running"};

    shareWorker_ = std::make_unique<workers::ShareWorker>(
        workers::WorkerDeps<ShareTask>{shareQueue_, client_, limiter_, executionLock_,
                                       hasAccount() ? store_ : nullptr, events_},
        cfg_.queue);
    shareWorker_->start();

    announce("share worker started");
    return {true, ""};
}

void CoreService::pauseShare() {
    std::scoped_lock lock(lifecycleMutex_);
    if (!shareWorker_) return;
    shareWorker_->pause();
    announce("share paused");
}

void CoreService::resumeShare() {
    std::scoped_lock lock(lifecycleMutex_);
    if (!shareWorker_) return;
    shareWorker_->resume();
    announce("share resumed");
}

void CoreService::stopShare() {
    std::scoped_lock lock(lifecycleMutex_);
    if (!shareWorker_) return;
    shareWorker_->requestStop();
    retired_.push_back(std::move(shareWorker_));
    announce("share stopped");
}

void CoreService::reapRetired() {
    // Only workers whose loop has exited; joining a busy one would block the caller.
    std::erase_if(retired_, [](const std::unique_ptr<AsyncService>& w) { return !w->isRunning(); });
}

bool CoreService::chainShareTask(const TransferTask& transfer) {
    if (!transfer.auto_share) return false;

    if (transfer.filename.empty()) {
        LogRegistry::ferry()->warn("[CoreService] Auto-share skipped for transfer {}: filename unknown",
                                   transfer.id ? std::to_string(*transfer.id) : "(unsaved)");
        return false;
    }

    try {
        announce(fmt::format("creating share task for '{}' in {}", transfer.filename, transfer.target_path));

        const auto listing = listDirectory(transfer.target_path);
        if (const auto* code = std::get_if<int>(&listing)) {
            announce(fmt::format("auto-share listing of {} failed (code {})", transfer.target_path, *code));
            return false;
        }

        const auto& entries = std::get<std::vector<remote::RemoteEntry>>(listing);
        const auto match = std::find_if(entries.begin(), entries.end(), [&](const remote::RemoteEntry& e) {
            return e.server_filename == transfer.filename;
        });
        if (match == entries.end()) {
            announce(fmt::format("auto-share found no '{}' in {}", transfer.filename, transfer.target_path));
            return false;
        }

        auto task = std::make_shared<ShareTask>();
        task->title = transfer.title.empty() ? transfer.filename : transfer.title;
        task->fs_id = match->fs_id;
        task->file_info = FileInfo{match->fs_id, match->server_filename, match->path};
        task->file_path = match->path;
        task->expiry_days = cfg_.queue.default_share_expiry_days;
        task->password_mode = PasswordMode::Random;
        task->created_at = util::now();
        task->session_tag = sessionTag_;
        task->metadata = nlohmann::json::object();
        task->metadata["auto_created_from_transfer"] =
            transfer.id ? nlohmann::json(*transfer.id) : nlohmann::json(nullptr);

        persistNew(*task);
        shareQueue_->append(task);

        announce(fmt::format("auto-share task created: {}", task->title));
        return true;
    } catch (const std::exception& e) {
        LogRegistry::ferry()->error("[CoreService] Auto-share failed for '{}': {}", transfer.filename, e.what());
        announce(fmt::format("auto-share failed: {}", e.what()));
        return false;
    }
}

bool CoreService::removeTransferTask(const unsigned int id) {
    transferQueue_->removeById(id);
    if (!hasAccount()) return true;
    try {
        return store_->deleteTransferTask(id);
    } catch (const std::exception& e) {
        LogRegistry::db()->error("[CoreService] Failed to delete transfer task {}: {}", id, e.what());
        return false;
    }
}

bool CoreService::removeShareTask(const unsigned int id) {
    shareQueue_->removeById(id);
    if (!hasAccount()) return true;
    try {
        return store_->deleteShareTask(id);
    } catch (const std::exception& e) {
        LogRegistry::db()->error("[CoreService] Failed to delete share task {}: {}", id, e.what());
        return false;
    }
}

bool CoreService::reorderTransferTasks(const std::vector<unsigned int>& ids) {
    transferQueue_->reorder(ids);
    if (!hasAccount()) return true;
    try {
        return store_->reorderTransferTasks(account_, ids);
    } catch (const std::exception& e) {
        LogRegistry::db()->error("[CoreService] Failed to reorder transfer tasks: {}", e.what());
        return false;
    }
}

bool CoreService::reorderShareTasks(const std::vector<unsigned int>& ids) {
    shareQueue_->reorder(ids);
    if (!hasAccount()) return true;
    try {
        return store_->reorderShareTasks(account_, ids);
    } catch (const std::exception& e) {
        LogRegistry::db()->error("[CoreService] Failed to reorder share tasks: {}", e.what());
        return false;
    }
}

std::size_t CoreService::clearTransferQueue(const std::optional<TaskStatus>& status) {
    const auto removed = transferQueue_->clear(status);
    if (hasAccount()) {
        try {
            const auto stored = store_->clearTransferTasks(account_, status);
            LogRegistry::db()->debug("[CoreService] Cleared {} stored transfer tasks", stored);
        } catch (const std::exception& e) {
            LogRegistry::db()->error("[CoreService] Failed to clear stored transfer tasks: {}", e.what());
        }
    }
    announce(fmt::format("cleared {} transfer tasks{}", removed, status ? " with status " + to_string(*status) : ""));
    return removed;
}

std::size_t CoreService::clearShareQueue(const std::optional<TaskStatus>& status) {
    const auto removed = shareQueue_->clear(status);
    if (hasAccount()) {
        try {
            const auto stored = store_->clearShareTasks(account_, status);
            LogRegistry::db()->debug("[CoreService] Cleared {} stored share tasks", stored);
        } catch (const std::exception& e) {
            LogRegistry::db()->error("[CoreService] Failed to clear stored share tasks: {}", e.what());
        }
    }
    announce(fmt::format("cleared {} share tasks{}", removed, status ? " with status " + to_string(*status) : ""));
    return removed;
}

bool CoreService::toggleAutoShare(const unsigned int id, const bool autoShare) {
    transferQueue_->mutateById(id, [autoShare](TransferTask& t) { t.auto_share = autoShare; });
    if (!hasAccount()) return true;
    try {
        store::TransferTaskUpdate update;
        update.auto_share = autoShare;
        return store_->updateTransferTask(id, update);
    } catch (const std::exception& e) {
        LogRegistry::db()->error("[CoreService] Failed to update auto_share on task {}: {}", id, e.what());
        return false;
    }
}

QueueSnapshot<TransferTask> CoreService::transferStatus() const {
    QueueSnapshot<TransferTask> s;
    s.tasks = transferQueue_->snapshot();
    for (const auto& t : s.tasks) s.counts.add(t.status);

    std::scoped_lock lock(lifecycleMutex_);
    s.is_running = transferWorker_ && transferWorker_->isRunning();
    s.is_paused = transferWorker_ && transferWorker_->isPaused();
    return s;
}

QueueSnapshot<ShareTask> CoreService::shareStatus() const {
    QueueSnapshot<ShareTask> s;
    s.tasks = shareQueue_->snapshot();
    for (const auto& t : s.tasks) s.counts.add(t.status);

    std::scoped_lock lock(lifecycleMutex_);
    s.is_running = shareWorker_ && shareWorker_->isRunning();
    s.is_paused = shareWorker_ && shareWorker_->isPaused();
    return s;
}

std::vector<ShareResult> CoreService::shareResults() const {
    std::vector<ShareResult> results;
    for (const auto& t : shareQueue_->snapshot()) {
        if (t.status != TaskStatus::Completed) continue;
        const auto title = !t.title.empty() ? t.title : (t.file_info ? t.file_info->name : "");
        results.push_back({title, util::withAccessCode(t.share_link, t.share_password)});
    }
    return results;
}

std::variant<std::vector<ferry::remote::RemoteEntry>, int> CoreService::listDirectory(const std::string& path) {
    if (!isAuthenticated()) return remote::kGenericFailure;

    const auto lease = ExecutionLease::acquire(executionLock_);
    limiter_->pace();

    const auto client = client_;
    try {
        return runRemoteCall(lease, std::chrono::milliseconds(cfg_.queue.remote_call_timeout_ms),
                             [client, path] { return client->listDirectory(path); });
    } catch (const RemoteTimeout& e) {
        LogRegistry::remote()->warn("[CoreService] Listing {} timed out after {} ms", path, e.deadline().count());
        return remote::kCallTimedOut;
    }
}

std::variant<std::vector<ferry::remote::RemoteEntry>, int> CoreService::searchFiles(const std::string& keyword,
                                                                             const std::string& path) {
    auto listing = listDirectory(path);
    if (std::holds_alternative<int>(listing)) return listing;

    const auto needle = toLower(keyword);
    std::vector<remote::RemoteEntry> matches;
    for (auto& entry : std::get<std::vector<remote::RemoteEntry>>(listing))
        if (toLower(entry.server_filename).find(needle) != std::string::npos) matches.push_back(std::move(entry));
    return matches;
}

void CoreService::addObserver(std::shared_ptr<QueueObserver> observer) {
    if (!observer) return;
    std::scoped_lock lock(observersMutex_);
    observers_.push_back(std::move(observer));
}

std::size_t CoreService::drainEvents() {
    std::scoped_lock lock(dispatchMutex_);
    std::size_t handled = 0;
    while (const auto event = events_->tryPop()) {
        handleEvent(*event);
        ++handled;
    }
    return handled;
}

void CoreService::notify(const std::function<void(QueueObserver&)>& fn) {
    std::vector<std::shared_ptr<QueueObserver>> observers;
    {
        std::scoped_lock lock(observersMutex_);
        observers = observers_;
    }
    for (const auto& o : observers) {
        try {
            fn(*o);
        } catch (const std::exception& e) {
            LogRegistry::ferry()->error("[CoreService] Observer callback threw: {}", e.what());
        }
    }
}

void CoreService::announce(const std::string& line) {
    LogRegistry::ferry()->info("[CoreService] {}", line);
    WorkerEvent event;
    event.type = WorkerEvent::Type::Log;
    event.message = line;
    events_->publish(std::move(event));
}

void CoreService::handleEvent(const WorkerEvent& event) {
    const auto kind = to_string(event.kind);

    switch (event.type) {
        case WorkerEvent::Type::Progress:
            notify([&](QueueObserver& o) {
                o.onProgress(event.kind, event.index, event.status);
                o.logLine(fmt::format("{} progress: task {} - {}", kind, event.index, to_string(event.status)));
            });
            break;

        case WorkerEvent::Type::Completed:
            if (event.kind == QueueKind::Transfer && event.transfer) {
                const auto& task = *event.transfer;
                notify([&](QueueObserver& o) {
                    o.onTransferCompleted(event.index, task.target_path, task);
                    o.logLine(event.message);
                });
                if (task.auto_share) chainShareTask(task);
            } else if (event.kind == QueueKind::Share && event.share) {
                const auto& task = *event.share;
                notify([&](QueueObserver& o) {
                    o.onShareCompleted(event.index, task.share_link, task.share_password);
                    o.logLine(event.message);
                });
            }
            break;

        case WorkerEvent::Type::Failed:
            notify([&](QueueObserver& o) {
                o.onFailed(event.kind, event.index, event.message);
                o.logLine(fmt::format("{} failed: task {} - {}", kind, event.index, event.message));
            });
            break;

        case WorkerEvent::Type::Log:
            notify([&](QueueObserver& o) { o.logLine(event.message); });
            break;
    }
}
