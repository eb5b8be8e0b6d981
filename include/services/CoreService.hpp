#pragma once

#include "config/Config.hpp"
#include "queue/EventChannel.hpp"
#include "queue/TaskQueue.hpp"
#include "remote/RemoteClient.hpp"
#include "types/QueueSnapshot.hpp"
#include "types/ShareTask.hpp"
#include "types/TransferTask.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ferry::concurrency { class RateLimiter; class ExecutionLock; }
namespace ferry::store { class TaskStore; }
namespace ferry::workers { class TransferWorker; class ShareWorker; }

namespace ferry::services {

class AsyncService;
class EventDispatcher;
class QueueObserver;

struct CoreServiceDeps {
    std::shared_ptr<remote::RemoteClient> client;
    std::shared_ptr<store::TaskStore> store;                    // optional
    std::shared_ptr<concurrency::RateLimiter> limiter;          // built from config when null
    std::shared_ptr<concurrency::ExecutionLock> executionLock;  // SerialExecutionLock when null
    bool dispatchEvents{true}; // false leaves event delivery to drainEvents()
};

struct StartResult {
    bool ok{false};
    std::string msg;
};

struct TransferImportRow {
    std::string title;
    std::string link;
    std::string password;
    std::string target_path;
};

struct ShareResult {
    std::string title;
    std::string link; // carries the access code as pwd
};

// Owns both queues, their workers and everything the workers share.
class CoreService {
public:
    CoreService(CoreServiceDeps deps, std::string account, const config::Config& cfg);
    ~CoreService();

    CoreService(const CoreService&) = delete;
    CoreService& operator=(const CoreService&) = delete;

    StartResult login(const std::string& sessionToken);
    [[nodiscard]] bool isAuthenticated() const { return authenticated_.load(); }

    // Queue population
    int addTransferTasks(const std::vector<TransferImportRow>& rows,
                         const std::string& defaultTargetPath,
                         bool autoShare = false);
    bool addTransferTask(const std::string& link, const std::string& password = "",
                         const std::string& targetPath = "");
    int addShareTasksFromPath(const std::string& path, unsigned int expiryDays = 7,
                              const std::optional<std::string>& password = std::nullopt);

    // Lifecycle
    StartResult startTransfer();
    void pauseTransfer();
    void resumeTransfer();
    void stopTransfer();

    StartResult startShare();
    void pauseShare();
    void resumeShare();
    void stopShare();

    // Creates a share task for a completed transfer whose file shows up in its
    // destination. Runs on the dispatcher thread for completed auto_share transfers.
    bool chainShareTask(const types::TransferTask& transfer);

    // Queue management
    bool removeTransferTask(unsigned int id);
    bool removeShareTask(unsigned int id);
    bool reorderTransferTasks(const std::vector<unsigned int>& ids);
    bool reorderShareTasks(const std::vector<unsigned int>& ids);
    std::size_t clearTransferQueue(const std::optional<types::TaskStatus>& status = std::nullopt);
    std::size_t clearShareQueue(const std::optional<types::TaskStatus>& status = std::nullopt);
    bool toggleAutoShare(unsigned int id, bool autoShare);

    // Reporting
    [[nodiscard]] types::QueueSnapshot<types::TransferTask> transferStatus() const;
    [[nodiscard]] types::QueueSnapshot<types::ShareTask> shareStatus() const;
    [[nodiscard]] std::vector<ShareResult> shareResults() const;

    // Remote pass-throughs, serialized with the workers.
    std::variant<std::vector<remote::RemoteEntry>, int> listDirectory(const std::string& path = "/");
    std::variant<std::vector<remote::RemoteEntry>, int> searchFiles(const std::string& keyword,
                                                                    const std::string& path = "/");

    void addObserver(std::shared_ptr<QueueObserver> observer);

    // Delivers queued worker events on the calling thread. Returns how many were handled.
    std::size_t drainEvents();

    [[nodiscard]] const std::string& sessionTag() const { return sessionTag_; }
    [[nodiscard]] const std::string& account() const { return account_; }

private:
    config::Config cfg_;
    std::string account_;
    std::string sessionTag_;

    std::shared_ptr<remote::RemoteClient> client_;
    std::shared_ptr<store::TaskStore> store_;
    std::shared_ptr<concurrency::RateLimiter> limiter_;
    std::shared_ptr<concurrency::ExecutionLock> executionLock_;

    std::shared_ptr<queue::TaskQueue<types::TransferTask>> transferQueue_;
    std::shared_ptr<queue::TaskQueue<types::ShareTask>> shareQueue_;
    std::shared_ptr<queue::EventChannel> events_;

    std::atomic<bool> authenticated_{false};

    mutable std::mutex lifecycleMutex_;
    std::unique_ptr<workers::TransferWorker> transferWorker_;
    std::unique_ptr<workers::ShareWorker> shareWorker_;
    std::vector<std::unique_ptr<AsyncService>> retired_;

    std::mutex observersMutex_;
    std::vector<std::shared_ptr<QueueObserver>> observers_;

    std::mutex dispatchMutex_;
    bool dispatchEvents_;
    std::unique_ptr<EventDispatcher> dispatcher_;

    [[nodiscard]] bool hasAccount() const { return !account_.empty() && store_ != nullptr; }

    void hydrate();
    void persistNew(types::TransferTask& task);
    void persistNew(types::ShareTask& task);
    void reapRetired();

    void handleEvent(const queue::WorkerEvent& event);
    void notify(const std::function<void(QueueObserver&)>& fn);

    // Logs at info and forwards the line to observers through the event channel.
    void announce(const std::string& line);
};

} // namespace ferry::services
