#include <gtest/gtest.h>
#include "workers/TransferWorker.hpp"
#include "config/ConfigRegistry.hpp"
#include "fakes/Eventually.hpp"
#include "fakes/FakeRemoteClient.hpp"
#include "fakes/FakeTaskStore.hpp"

#include <chrono>
#include <thread>

using namespace ferry;
using namespace ferry::types;
using namespace ferry::workers;
using namespace std::chrono_literals;

class TransferWorkerTest : public ::testing::Test {
protected:
    std::shared_ptr<queue::TaskQueue<TransferTask>> transfers = std::make_shared<queue::TaskQueue<TransferTask>>();
    std::shared_ptr<test::FakeRemoteClient> client = std::make_shared<test::FakeRemoteClient>();
    std::shared_ptr<test::FakeTaskStore> store = std::make_shared<test::FakeTaskStore>();
    std::shared_ptr<queue::EventChannel> events = std::make_shared<queue::EventChannel>();
    std::shared_ptr<concurrency::RateLimiter> limiter;
    config::QueueConfig cfg;

    void SetUp() override {
        auto throttle = config::ConfigRegistry::get().throttle;
        throttle.jitter_ms_min = throttle.jitter_ms_max = 0;
        limiter = std::make_shared<concurrency::RateLimiter>(throttle, [](std::chrono::milliseconds) {});
        cfg = config::ConfigRegistry::get().queue;
    }

    void TearDown() override { client->openGate(); }

    std::unique_ptr<TransferWorker> makeWorker(std::shared_ptr<concurrency::ExecutionLock> lock =
                                                   std::make_shared<concurrency::NoopExecutionLock>()) {
        return std::make_unique<TransferWorker>(
            WorkerDeps<TransferTask>{transfers, client, limiter, std::move(lock), store, events}, cfg);
    }

    unsigned int enqueue(const std::string& link, const std::string& password = "",
                         const std::string& target = "/inbox") {
        TransferTask t(link, password, target);
        t.title = "task " + link;
        const auto id = store->seed("alice", t);
        t.id = id;
        transfers->append(std::make_shared<TransferTask>(t));
        return id;
    }

    TransferTask queued(const unsigned int id) const { return *transfers->findById(id); }
};

TEST_F(TransferWorkerTest, SkippableCodeSkipsWithoutCountingFailure) {
    const auto worker = makeWorker();
    const auto id = enqueue("https://pan.example/s/dup");
    client->scriptTransfer({remote::kDuplicateName});

    EXPECT_TRUE(worker->processNext());

    const auto t = queued(id);
    EXPECT_EQ(t.status, TaskStatus::Skipped);
    EXPECT_NE(t.error_message.find("-8"), std::string::npos);
    EXPECT_EQ(limiter->consecutiveFailures(), 0u);
    EXPECT_EQ(store->transfer(id)->status, TaskStatus::Skipped);

    const auto published = events->drain();
    ASSERT_EQ(published.size(), 2u);
    EXPECT_EQ(published[0].type, queue::WorkerEvent::Type::Progress);
    EXPECT_EQ(published[0].status, TaskStatus::Running);
    EXPECT_EQ(published[1].type, queue::WorkerEvent::Type::Failed);
    EXPECT_EQ(published[1].message.rfind("skipped - ", 0), 0u);
}

TEST_F(TransferWorkerTest, GenericFailureCountsTowardsPause) {
    const auto worker = makeWorker();
    const auto id = enqueue("https://pan.example/s/bad");
    client->scriptTransfer({remote::kGenericFailure});

    worker->processNext();

    EXPECT_EQ(queued(id).status, TaskStatus::Failed);
    EXPECT_EQ(limiter->consecutiveFailures(), 1u);
    EXPECT_EQ(store->transfer(id)->status, TaskStatus::Failed);
}

TEST_F(TransferWorkerTest, SuccessRecordsFilenameAndResetsFailures) {
    const auto worker = makeWorker();
    limiter->onFailure(remote::kGenericFailure);
    client->resolvedFilename = "report.pdf";
    const auto id = enqueue("https://pan.example/s/abc?pwd=1234");

    worker->processNext();

    const auto t = queued(id);
    EXPECT_EQ(t.status, TaskStatus::Completed);
    EXPECT_EQ(t.filename, "report.pdf");
    EXPECT_TRUE(t.error_message.empty());
    EXPECT_EQ(limiter->consecutiveFailures(), 0u);

    const auto stored = store->transfer(id);
    EXPECT_EQ(stored->status, TaskStatus::Completed);
    EXPECT_EQ(stored->filename, "report.pdf");
    EXPECT_EQ(stored->target_path, "/inbox");

    const auto calls = client->transferCalls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].baseUrl, "https://pan.example/s/abc");
    EXPECT_EQ(calls[0].code, "1234");
    EXPECT_EQ(calls[0].destPath, "/inbox");

    const auto published = events->drain();
    ASSERT_EQ(published.size(), 2u);
    EXPECT_EQ(published[1].type, queue::WorkerEvent::Type::Completed);
    EXPECT_EQ(published[1].kind, queue::QueueKind::Transfer);
    ASSERT_TRUE(published[1].transfer);
    EXPECT_EQ(published[1].transfer->filename, "report.pdf");
}

TEST_F(TransferWorkerTest, StoredPasswordUsedWhenLinkHasNone) {
    const auto worker = makeWorker();
    enqueue("https://pan.example/s/plain", "9z9z");

    worker->processNext();

    const auto calls = client->transferCalls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].baseUrl, "https://pan.example/s/plain");
    EXPECT_EQ(calls[0].code, "9z9z");
}

TEST_F(TransferWorkerTest, EmptyLinkFailsWithContext) {
    const auto worker = makeWorker();
    const auto id = enqueue("");

    worker->processNext();

    const auto t = queued(id);
    EXPECT_EQ(t.status, TaskStatus::Failed);
    EXPECT_EQ(t.error_message, "transfer error: share link is empty\nlink: N/A\ntarget: /inbox");
    EXPECT_TRUE(client->transferCalls().empty());
}

TEST_F(TransferWorkerTest, ClientExceptionFailsTask) {
    const auto worker = makeWorker();
    client->transferError = "connection reset";
    const auto id = enqueue("https://pan.example/s/abc");

    worker->processNext();

    const auto t = queued(id);
    EXPECT_EQ(t.status, TaskStatus::Failed);
    EXPECT_EQ(t.error_message.rfind("transfer error: connection reset", 0), 0u);
}

TEST_F(TransferWorkerTest, FilenameLookupFailureDoesNotBlockTransfer) {
    const auto worker = makeWorker();
    client->lookupThrows = true;
    const auto id = enqueue("https://pan.example/s/abc?pwd=1234");

    worker->processNext();

    const auto t = queued(id);
    EXPECT_EQ(t.status, TaskStatus::Completed);
    EXPECT_TRUE(t.filename.empty());
}

TEST_F(TransferWorkerTest, StoreFailureLeavesTaskOutcomeIntact) {
    const auto worker = makeWorker();
    const auto id = enqueue("https://pan.example/s/abc");
    store->failWrites = true;

    worker->processNext();

    EXPECT_EQ(queued(id).status, TaskStatus::Completed);
    EXPECT_EQ(store->transfer(id)->status, TaskStatus::Pending);
}

TEST_F(TransferWorkerTest, NothingPending) {
    const auto worker = makeWorker();
    const auto id = enqueue("https://pan.example/s/done");
    transfers->mutateById(id, [](TransferTask& t) { t.status = TaskStatus::Completed; });

    EXPECT_FALSE(worker->processNext());
    EXPECT_EQ(events->size(), 0u);
}

TEST_F(TransferWorkerTest, SlowCallTimesOut) {
    cfg.remote_call_timeout_ms = 40;
    const auto lock = std::make_shared<concurrency::SerialExecutionLock>();
    const auto worker = makeWorker(lock);
    const auto id = enqueue("https://pan.example/s/slow");
    client->closeGate();

    worker->processNext();

    const auto t = queued(id);
    EXPECT_EQ(t.status, TaskStatus::Timeout);
    EXPECT_EQ(t.error_message, "transfer timed out after 40 ms");
    EXPECT_EQ(limiter->consecutiveFailures(), 1u);

    // The abandoned call keeps the session locked until it returns.
    EXPECT_TRUE(lock->isHeld());
    client->openGate();
    EXPECT_TRUE(test::eventually([&] { return !lock->isHeld(); }));
}

TEST_F(TransferWorkerTest, MissingCollaboratorRejected) {
    WorkerDeps<TransferTask> deps{transfers, nullptr, limiter, std::make_shared<concurrency::NoopExecutionLock>(),
                                  store, events};
    EXPECT_THROW({ TransferWorker worker(deps, cfg); }, std::invalid_argument);
}

TEST_F(TransferWorkerTest, LoopDrainsQueueInOrder) {
    const auto worker = makeWorker(std::make_shared<concurrency::SerialExecutionLock>());
    worker->start();

    enqueue("https://pan.example/s/1");
    enqueue("https://pan.example/s/2");
    enqueue("https://pan.example/s/3");

    ASSERT_TRUE(test::eventually([&] { return transfers->counts().completed == 3; }));
    worker->stop();

    const auto calls = client->transferCalls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].baseUrl, "https://pan.example/s/1");
    EXPECT_EQ(calls[2].baseUrl, "https://pan.example/s/3");
    EXPECT_FALSE(worker->isRunning());
}

TEST_F(TransferWorkerTest, PausedLoopClaimsNothing) {
    const auto worker = makeWorker();
    worker->pause();
    worker->start();

    const auto id = enqueue("https://pan.example/s/1");
    std::this_thread::sleep_for(80ms);
    EXPECT_EQ(queued(id).status, TaskStatus::Pending);
    EXPECT_TRUE(client->transferCalls().empty());

    worker->resume();
    EXPECT_TRUE(test::eventually([&] { return queued(id).status == TaskStatus::Completed; }));
    worker->stop();
}
