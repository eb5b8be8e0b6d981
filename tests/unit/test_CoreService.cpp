#include <gtest/gtest.h>
#include "services/CoreService.hpp"
#include "services/QueueObserver.hpp"
#include "concurrency/RateLimiter.hpp"
#include "remote/ErrorCodes.hpp"
#include "config/ConfigRegistry.hpp"
#include "fakes/Eventually.hpp"
#include "fakes/FakeRemoteClient.hpp"
#include "fakes/FakeTaskStore.hpp"

#include <chrono>
#include <mutex>
#include <thread>

using namespace ferry;
using namespace ferry::services;
using namespace ferry::types;
using namespace std::chrono_literals;

namespace {

class RecordingObserver : public QueueObserver {
public:
    void onProgress(queue::QueueKind kind, std::size_t, TaskStatus status) override {
        std::scoped_lock lock(mutex);
        progress.emplace_back(kind, status);
    }

    void onTransferCompleted(std::size_t, const std::string& targetPath, const TransferTask& task) override {
        std::scoped_lock lock(mutex);
        transfers.push_back(targetPath + "/" + task.filename);
    }

    void onShareCompleted(std::size_t, const std::string& link, const std::string& password) override {
        std::scoped_lock lock(mutex);
        shares.push_back(link + "#" + password);
    }

    void onFailed(queue::QueueKind, std::size_t, const std::string& message) override {
        std::scoped_lock lock(mutex);
        failures.push_back(message);
    }

    void logLine(const std::string& line) override {
        std::scoped_lock lock(mutex);
        lines.push_back(line);
    }

    bool sawLine(const std::string& needle) {
        std::scoped_lock lock(mutex);
        for (const auto& l : lines) if (l.find(needle) != std::string::npos) return true;
        return false;
    }

    std::size_t transferCount() {
        std::scoped_lock lock(mutex);
        return transfers.size();
    }

    std::mutex mutex;
    std::vector<std::pair<queue::QueueKind, TaskStatus>> progress;
    std::vector<std::string> transfers, shares, failures, lines;
};

} // namespace

class CoreServiceTest : public ::testing::Test {
protected:
    std::shared_ptr<test::FakeRemoteClient> client = std::make_shared<test::FakeRemoteClient>();
    std::shared_ptr<test::FakeTaskStore> store = std::make_shared<test::FakeTaskStore>();
    std::shared_ptr<RecordingObserver> observer = std::make_shared<RecordingObserver>();
    config::Config cfg;
    std::unique_ptr<CoreService> core;

    void SetUp() override {
        cfg = config::ConfigRegistry::get();
        cfg.throttle.jitter_ms_min = cfg.throttle.jitter_ms_max = 0;
    }

    void TearDown() override {
        client->openGate();
        core.reset();
    }

    CoreService& make(const std::string& account = "alice", const bool dispatch = false) {
        CoreServiceDeps deps;
        deps.client = client;
        deps.store = store;
        deps.limiter = std::make_shared<concurrency::RateLimiter>(cfg.throttle, [](std::chrono::milliseconds) {});
        deps.dispatchEvents = dispatch;
        core = std::make_unique<CoreService>(std::move(deps), account, cfg);
        core->addObserver(observer);
        return *core;
    }

    CoreService& loggedIn(const std::string& account = "alice", const bool dispatch = false) {
        auto& c = make(account, dispatch);
        EXPECT_TRUE(c.login("token").ok);
        return c;
    }

    static TransferTask storedTransfer(const std::string& link, const TaskStatus status) {
        TransferTask t(link, "", "/inbox");
        t.status = status;
        t.session_tag = "20250101_000000";
        return t;
    }

    std::vector<unsigned int> transferIds() const {
        std::vector<unsigned int> ids;
        for (const auto& t : core->transferStatus().tasks) ids.push_back(*t.id);
        return ids;
    }
};

TEST_F(CoreServiceTest, StartRefusedBeforeLogin) {
    auto& c = make();
    const auto transfer = c.startTransfer();
    EXPECT_FALSE(transfer.ok);
    EXPECT_EQ(transfer.msg, "not logged in");
    EXPECT_FALSE(c.startShare().ok);
    EXPECT_FALSE(c.transferStatus().is_running);
}

TEST_F(CoreServiceTest, LoginFailureKeepsServiceLocked) {
    client->authenticateResult = false;
    auto& c = make();

    const auto result = c.login("expired");
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.msg.empty());
    EXPECT_FALSE(c.isAuthenticated());
    EXPECT_FALSE(c.startTransfer().ok);
    EXPECT_EQ(client->tokens().at(0), "expired");
}

TEST_F(CoreServiceTest, ImportSkipsBlankLinksAndExtractsCodes) {
    auto& c = make();
    const std::vector<TransferImportRow> rows = {
        {"Alpha", " https://pan.example/s/abc?pwd=1234 ", "", ""},
        {"Blank", "   ", "", ""},
        {"Gamma", "https://pan.example/s/def", "5678", "/custom"},
    };

    EXPECT_EQ(c.addTransferTasks(rows, "/batch", true), 2);

    const auto tasks = c.transferStatus().tasks;
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].title, "Alpha");
    EXPECT_EQ(tasks[0].share_link, "https://pan.example/s/abc?pwd=1234");
    EXPECT_EQ(tasks[0].share_password, "1234");
    EXPECT_EQ(tasks[0].target_path, "/batch");
    EXPECT_TRUE(tasks[0].auto_share);
    EXPECT_EQ(tasks[0].status, TaskStatus::Pending);
    EXPECT_EQ(tasks[0].session_tag, c.sessionTag());
    EXPECT_EQ(tasks[1].share_password, "5678");
    EXPECT_EQ(tasks[1].target_path, "/custom");

    ASSERT_TRUE(tasks[0].id);
    EXPECT_EQ(store->transferCount(), 2u);
    EXPECT_EQ(store->transfer(*tasks[1].id)->share_link, "https://pan.example/s/def");
}

TEST_F(CoreServiceTest, ImportSurvivesStoreOutage) {
    auto& c = make();
    store->failWrites = true;

    EXPECT_EQ(c.addTransferTasks({{"Alpha", "https://pan.example/s/abc", "", ""}}, "/batch"), 1);

    const auto tasks = c.transferStatus().tasks;
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_FALSE(tasks[0].id);
}

TEST_F(CoreServiceTest, SingleTransferUsesDefaultTarget) {
    auto& c = make();
    EXPECT_FALSE(c.addTransferTask("  "));
    EXPECT_TRUE(c.addTransferTask("https://pan.example/s/abc?pwd=wxyz"));

    const auto tasks = c.transferStatus().tasks;
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].share_password, "wxyz");
    EXPECT_EQ(tasks[0].target_path, cfg.queue.default_target_path);
    EXPECT_EQ(store->transferCount(), 1u);
}

TEST_F(CoreServiceTest, HydrationRequeuesInterruptedTasks) {
    const auto running = store->seed("alice", storedTransfer("https://pan.example/s/1", TaskStatus::Running));
    const auto done = store->seed("alice", storedTransfer("https://pan.example/s/2", TaskStatus::Completed));
    store->seed("bob", storedTransfer("https://pan.example/s/3", TaskStatus::Pending));

    ShareTask share;
    share.fs_id = 8;
    share.status = TaskStatus::Running;
    store->seed("alice", share);

    auto& c = loggedIn();

    const auto transfers = c.transferStatus();
    ASSERT_EQ(transfers.tasks.size(), 2u);
    EXPECT_EQ(*transfers.tasks[0].id, running);
    EXPECT_EQ(transfers.tasks[0].status, TaskStatus::Pending);
    EXPECT_EQ(transfers.tasks[0].session_tag, "20250101_000000");
    EXPECT_EQ(*transfers.tasks[1].id, done);
    EXPECT_EQ(transfers.tasks[1].status, TaskStatus::Completed);
    EXPECT_EQ(transfers.counts.pending, 1u);

    const auto shares = c.shareStatus();
    ASSERT_EQ(shares.tasks.size(), 1u);
    EXPECT_EQ(shares.tasks[0].status, TaskStatus::Pending);
}

TEST_F(CoreServiceTest, ChainCreatesRandomShareForCompletedTransfer) {
    auto& c = loggedIn();
    client->setDirectory("/batch", {
        {555, "report.pdf", "/batch/report.pdf", false},
        {556, "other.txt", "/batch/other.txt", false},
    });

    TransferTask transfer("https://pan.example/s/abc", "1234", "/batch");
    transfer.id = 9;
    transfer.title = "Q3 report";
    transfer.status = TaskStatus::Completed;
    transfer.filename = "report.pdf";
    transfer.auto_share = true;

    EXPECT_TRUE(c.chainShareTask(transfer));

    const auto tasks = c.shareStatus().tasks;
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].password_mode, PasswordMode::Random);
    EXPECT_EQ(tasks[0].fs_id, 555u);
    EXPECT_EQ(tasks[0].title, "Q3 report");
    EXPECT_EQ(tasks[0].file_path, "/batch/report.pdf");
    EXPECT_EQ(tasks[0].expiry_days, cfg.queue.default_share_expiry_days);
    EXPECT_EQ(tasks[0].metadata.at("auto_created_from_transfer"), 9);
    EXPECT_EQ(store->shareCount(), 1u);
}

TEST_F(CoreServiceTest, ChainDeclinesWithoutMatch) {
    auto& c = make();

    TransferTask transfer("https://pan.example/s/abc", "", "/batch");
    transfer.filename = "report.pdf";

    EXPECT_FALSE(c.chainShareTask(transfer)); // auto_share off

    transfer.auto_share = true;
    EXPECT_FALSE(c.chainShareTask(transfer)); // not logged in

    ASSERT_TRUE(c.login("token").ok);
    client->setDirectory("/batch", {{1, "different.pdf", "/batch/different.pdf", false}});
    EXPECT_FALSE(c.chainShareTask(transfer));

    transfer.filename.clear();
    EXPECT_FALSE(c.chainShareTask(transfer));

    EXPECT_TRUE(c.shareStatus().tasks.empty());
}

TEST_F(CoreServiceTest, CompletedAutoShareTransferChainsThroughEvents) {
    auto& c = loggedIn();
    client->resolvedFilename = "report.pdf";
    client->setDirectory("/batch", {{555, "report.pdf", "/batch/report.pdf", false}});
    c.addTransferTasks({{"Q3", "https://pan.example/s/abc?pwd=1234", "", ""}}, "/batch", true);

    ASSERT_TRUE(c.startTransfer().ok);
    ASSERT_TRUE(test::eventually([&] { return c.transferStatus().counts.completed == 1; }));
    c.stopTransfer();

    c.drainEvents();

    EXPECT_EQ(observer->transferCount(), 1u);
    EXPECT_EQ(observer->transfers.at(0), "/batch/report.pdf");

    const auto shares = c.shareStatus().tasks;
    ASSERT_EQ(shares.size(), 1u);
    EXPECT_EQ(shares[0].title, "Q3");
    EXPECT_EQ(shares[0].fs_id, 555u);
    ASSERT_TRUE(shares[0].metadata.contains("auto_created_from_transfer"));
}

TEST_F(CoreServiceTest, StalledChainListingTimesOut) {
    cfg.queue.remote_call_timeout_ms = 40;
    auto& c = loggedIn();
    client->resolvedFilename = "report.pdf";
    c.addTransferTasks({{"Q3", "https://pan.example/s/abc?pwd=1234", "", ""}}, "/batch", true);

    ASSERT_TRUE(c.startTransfer().ok);
    ASSERT_TRUE(test::eventually([&] { return c.transferStatus().counts.completed == 1; }));
    c.stopTransfer();

    client->gateListings = true;
    client->closeGate();

    // Returns even though the chain's listing never answers.
    c.drainEvents();

    EXPECT_EQ(observer->transferCount(), 1u);
    EXPECT_TRUE(observer->sawLine("auto-share listing of /batch failed (code -1000)"));
    EXPECT_EQ(client->listCalls().size(), 1u);
    EXPECT_TRUE(c.shareStatus().tasks.empty());
}

TEST_F(CoreServiceTest, DispatcherDeliversEventsWithoutDraining) {
    auto& c = loggedIn("alice", true);
    c.addTransferTask("https://pan.example/s/abc");

    ASSERT_TRUE(c.startTransfer().ok);
    EXPECT_TRUE(test::eventually([&] { return observer->transferCount() == 1; }));
    EXPECT_TRUE(observer->sawLine("transfer worker started"));
}

TEST_F(CoreServiceTest, FailedTransfersReachObservers) {
    auto& c = loggedIn();
    client->scriptTransfer({remote::kGenericFailure, remote::kLinkExpired});
    c.addTransferTask("https://pan.example/s/a");
    c.addTransferTask("https://pan.example/s/b");

    ASSERT_TRUE(c.startTransfer().ok);
    ASSERT_TRUE(test::eventually([&] {
        const auto counts = c.transferStatus().counts;
        return counts.failed == 1 && counts.skipped == 1;
    }));
    c.stopTransfer();
    c.drainEvents();

    std::scoped_lock lock(observer->mutex);
    ASSERT_EQ(observer->failures.size(), 2u);
    EXPECT_EQ(observer->failures[1].rfind("skipped - ", 0), 0u);
}

TEST_F(CoreServiceTest, StartTwiceIsRefused) {
    auto& c = loggedIn();
    ASSERT_TRUE(c.startTransfer().ok);
    const auto again = c.startTransfer();
    EXPECT_FALSE(again.ok);
    EXPECT_EQ(again.msg, "transfer worker already running");
    EXPECT_TRUE(c.transferStatus().is_running);
}

TEST_F(CoreServiceTest, StopThenRestart) {
    auto& c = loggedIn();
    ASSERT_TRUE(c.startShare().ok);
    c.stopShare();
    EXPECT_FALSE(c.shareStatus().is_running);

    ASSERT_TRUE(c.startShare().ok);
    EXPECT_TRUE(c.shareStatus().is_running);
}

TEST_F(CoreServiceTest, PauseTakesEffectBetweenTasks) {
    auto& c = loggedIn();
    c.addTransferTask("https://pan.example/s/1");
    c.addTransferTask("https://pan.example/s/2");
    client->closeGate();

    ASSERT_TRUE(c.startTransfer().ok);
    ASSERT_TRUE(client->waitForEntered(1));

    c.pauseTransfer();
    client->openGate();

    ASSERT_TRUE(test::eventually([&] { return c.transferStatus().counts.completed == 1; }));
    std::this_thread::sleep_for(80ms);

    auto status = c.transferStatus();
    EXPECT_TRUE(status.is_paused);
    EXPECT_EQ(status.counts.pending, 1u);
    EXPECT_EQ(client->transferCalls().size(), 1u);

    c.resumeTransfer();
    EXPECT_TRUE(test::eventually([&] { return c.transferStatus().counts.completed == 2; }));
    EXPECT_FALSE(c.transferStatus().is_paused);
}

TEST_F(CoreServiceTest, ClearByStatusInMemoryAndStore) {
    store->seed("alice", storedTransfer("https://pan.example/s/1", TaskStatus::Completed));
    store->seed("alice", storedTransfer("https://pan.example/s/2", TaskStatus::Pending));
    store->seed("alice", storedTransfer("https://pan.example/s/3", TaskStatus::Failed));
    store->seed("alice", storedTransfer("https://pan.example/s/4", TaskStatus::Completed));
    store->seed("alice", storedTransfer("https://pan.example/s/5", TaskStatus::Skipped));
    auto& c = loggedIn();

    EXPECT_EQ(c.clearTransferQueue(TaskStatus::Completed), 2u);

    const auto counts = c.transferStatus().counts;
    EXPECT_EQ(counts.total, 3u);
    EXPECT_EQ(counts.completed, 0u);
    EXPECT_EQ(counts.pending, 1u);
    EXPECT_EQ(counts.failed, 1u);
    EXPECT_EQ(counts.skipped, 1u);
    EXPECT_EQ(store->transferCount(), 3u);

    EXPECT_EQ(c.clearTransferQueue(), 3u);
    EXPECT_EQ(store->transferCount(), 0u);
}

TEST_F(CoreServiceTest, ReorderInMemoryAndStore) {
    const auto a = store->seed("alice", storedTransfer("https://pan.example/s/1", TaskStatus::Pending));
    const auto b = store->seed("alice", storedTransfer("https://pan.example/s/2", TaskStatus::Pending));
    const auto d = store->seed("alice", storedTransfer("https://pan.example/s/3", TaskStatus::Pending));
    auto& c = loggedIn();

    EXPECT_TRUE(c.reorderTransferTasks({d, a}));

    EXPECT_EQ(transferIds(), (std::vector<unsigned int>{d, a}));
    EXPECT_EQ(store->transfer(d)->order_index, 0);
    EXPECT_EQ(store->transfer(a)->order_index, 1);
    EXPECT_TRUE(store->transfer(b));
}

TEST_F(CoreServiceTest, RemoveDeletesFromQueueAndStore) {
    const auto a = store->seed("alice", storedTransfer("https://pan.example/s/1", TaskStatus::Pending));
    const auto b = store->seed("alice", storedTransfer("https://pan.example/s/2", TaskStatus::Pending));
    auto& c = loggedIn();

    EXPECT_TRUE(c.removeTransferTask(a));
    EXPECT_EQ(transferIds(), (std::vector<unsigned int>{b}));
    EXPECT_FALSE(store->transfer(a));

    EXPECT_FALSE(c.removeTransferTask(4242));
}

TEST_F(CoreServiceTest, WithoutAccountNothingIsStored) {
    auto& c = make("");
    c.addTransferTask("https://pan.example/s/abc");

    EXPECT_EQ(store->transferCount(), 0u);
    EXPECT_FALSE(c.transferStatus().tasks.at(0).id);
    EXPECT_TRUE(c.removeTransferTask(1));
    EXPECT_EQ(c.transferStatus().tasks.size(), 1u);
}

TEST_F(CoreServiceTest, ToggleAutoShare) {
    const auto id = store->seed("alice", storedTransfer("https://pan.example/s/1", TaskStatus::Pending));
    auto& c = loggedIn();

    EXPECT_TRUE(c.toggleAutoShare(id, true));
    EXPECT_TRUE(c.transferStatus().tasks.at(0).auto_share);
    EXPECT_TRUE(store->transfer(id)->auto_share);

    store->failUpdates = true;
    EXPECT_FALSE(c.toggleAutoShare(id, false));
    EXPECT_FALSE(c.transferStatus().tasks.at(0).auto_share);
}

TEST_F(CoreServiceTest, ShareResultsListOnlyCompletedWithCodes) {
    ShareTask done;
    done.fs_id = 1;
    done.title = "Q3 report";
    done.status = TaskStatus::Completed;
    done.share_link = "https://pan.example/s/q3";
    done.share_password = "ab12";
    store->seed("alice", done);

    ShareTask open;
    open.fs_id = 2;
    open.file_info = FileInfo{2, "notes.txt", "/notes.txt"};
    open.status = TaskStatus::Completed;
    open.share_link = "https://pan.example/s/notes";
    store->seed("alice", open);

    ShareTask pending;
    pending.fs_id = 3;
    store->seed("alice", pending);

    auto& c = loggedIn();

    const auto results = c.shareResults();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].title, "Q3 report");
    EXPECT_EQ(results[0].link, "https://pan.example/s/q3?pwd=ab12");
    EXPECT_EQ(results[1].title, "notes.txt");
    EXPECT_EQ(results[1].link, "https://pan.example/s/notes");
}

TEST_F(CoreServiceTest, ShareTasksFromPathBorrowTransferTitles) {
    auto done = storedTransfer("https://pan.example/s/1", TaskStatus::Completed);
    done.title = "Alpha";
    done.filename = "a.pdf";
    store->seed("alice", done);
    auto& c = loggedIn();

    client->setDirectory("/inbox", {
        {11, "a.pdf", "/inbox/a.pdf", false},
        {12, "b.txt", "/inbox/b.txt", false},
    });

    EXPECT_EQ(c.addShareTasksFromPath("/inbox", 30, std::string("pw12")), 2);

    const auto tasks = c.shareStatus().tasks;
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].title, "Alpha");
    EXPECT_EQ(tasks[1].title, "b.txt");
    EXPECT_EQ(tasks[0].password_mode, PasswordMode::Fixed);
    EXPECT_EQ(tasks[0].share_password, "pw12");
    EXPECT_EQ(tasks[1].expiry_days, 30u);
    EXPECT_EQ(store->shareCount(), 2u);

    EXPECT_EQ(c.addShareTasksFromPath("/empty"), 0);
}

TEST_F(CoreServiceTest, ShareTasksFromPathRequireLoginAndListing) {
    auto& c = make();
    EXPECT_EQ(c.addShareTasksFromPath("/inbox"), 0);
    EXPECT_TRUE(client->listCalls().empty());

    ASSERT_TRUE(c.login("token").ok);
    client->setListError(remote::kNotLoggedIn);
    EXPECT_EQ(c.addShareTasksFromPath("/inbox"), 0);
    EXPECT_TRUE(c.shareStatus().tasks.empty());
}

TEST_F(CoreServiceTest, SearchFilesIgnoresCase) {
    auto& c = make();
    const auto refused = c.searchFiles("report");
    ASSERT_TRUE(std::holds_alternative<int>(refused));
    EXPECT_EQ(std::get<int>(refused), remote::kGenericFailure);

    ASSERT_TRUE(c.login("token").ok);
    client->setDirectory("/", {
        {1, "Annual Report.PDF", "/Annual Report.PDF", false},
        {2, "notes.txt", "/notes.txt", false},
        {3, "reports", "/reports", true},
    });

    const auto found = c.searchFiles("report");
    ASSERT_TRUE(std::holds_alternative<std::vector<remote::RemoteEntry>>(found));
    const auto& entries = std::get<std::vector<remote::RemoteEntry>>(found);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].fs_id, 1u);
    EXPECT_EQ(entries[1].fs_id, 3u);
}

TEST_F(CoreServiceTest, AnnouncementsReachObservers) {
    auto& c = loggedIn();
    c.addTransferTasks({{"Alpha", "https://pan.example/s/abc", "", ""}}, "/batch");
    c.clearTransferQueue(TaskStatus::Failed);

    EXPECT_GE(c.drainEvents(), 3u);
    EXPECT_TRUE(observer->sawLine("login succeeded"));
    EXPECT_TRUE(observer->sawLine("imported 1 transfer tasks"));
    EXPECT_TRUE(observer->sawLine("cleared 0 transfer tasks with status failed"));
}
