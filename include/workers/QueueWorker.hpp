#pragma once

#include "services/AsyncService.hpp"
#include "config/Config.hpp"
#include "concurrency/ExecutionLock.hpp"
#include "concurrency/RateLimiter.hpp"
#include "concurrency/RemoteCall.hpp"
#include "queue/EventChannel.hpp"
#include "queue/TaskQueue.hpp"
#include "remote/ErrorCodes.hpp"
#include "remote/RemoteClient.hpp"
#include "store/TaskStore.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <fmt/format.h>
#include <spdlog/logger.h>

namespace ferry::workers {

// Collaborators a worker is bound to. Everything except the store is required.
template <typename T>
struct WorkerDeps {
    std::shared_ptr<queue::TaskQueue<T>> queue;
    std::shared_ptr<remote::RemoteClient> client;
    std::shared_ptr<concurrency::RateLimiter> limiter;
    std::shared_ptr<concurrency::ExecutionLock> executionLock;
    std::shared_ptr<store::TaskStore> store; // null when there is no account context
    std::shared_ptr<queue::EventChannel> events;
};

// One thread draining one queue: claim the oldest pending task, run it,
// record exactly one terminal state. Pause and stop are observed between tasks.
template <typename T>
class QueueWorker : public services::AsyncService {
public:
    using Queue = queue::TaskQueue<T>;
    using Claim = typename Queue::Claim;

    QueueWorker(const std::string& name,
                const queue::QueueKind kind,
                WorkerDeps<T> deps,
                const config::QueueConfig& cfg,
                std::shared_ptr<spdlog::logger> log)
        : AsyncService(name),
          kind_(kind),
          queue_(std::move(deps.queue)),
          client_(std::move(deps.client)),
          limiter_(std::move(deps.limiter)),
          executionLock_(std::move(deps.executionLock)),
          store_(std::move(deps.store)),
          events_(std::move(deps.events)),
          cfg_(cfg),
          log_(std::move(log)) {
        if (!queue_ || !client_ || !limiter_ || !executionLock_ || !events_)
            throw std::invalid_argument(name + " is missing a required collaborator");
    }

    ~QueueWorker() override { stop(); }

    void pause() {
        paused_.store(true);
        queue_->wake();
        log_->info("[{}] Paused", serviceName_);
    }

    void resume() {
        paused_.store(false);
        queue_->wake();
        log_->info("[{}] Resumed", serviceName_);
    }

    [[nodiscard]] bool isPaused() const { return paused_.load(); }

    // Claims and runs the next pending task on the calling thread. False when
    // nothing was pending.
    bool processNext() {
        auto claim = queue_->claimNextPending();
        if (!claim) return false;

        persistSafely(claim->copy);
        publish(queue::WorkerEvent::Type::Progress, claim->index, types::TaskStatus::Running, "");

        try {
            process(*claim);
        } catch (const concurrency::RemoteTimeout& e) {
            recordTimeout(*claim, e.deadline());
        } catch (const std::exception& e) {
            recordFault(*claim, e.what());
        }
        return true;
    }

protected:
    queue::QueueKind kind_;
    std::shared_ptr<Queue> queue_;
    std::shared_ptr<remote::RemoteClient> client_;
    std::shared_ptr<concurrency::RateLimiter> limiter_;
    std::shared_ptr<concurrency::ExecutionLock> executionLock_;
    std::shared_ptr<store::TaskStore> store_;
    std::shared_ptr<queue::EventChannel> events_;
    config::QueueConfig cfg_;
    std::shared_ptr<spdlog::logger> log_;

    // Executes one claimed task and records its outcome. May throw.
    virtual void process(const Claim& claim) = 0;

    // Writes the task's current state to the store.
    virtual void persist(unsigned int id, const T& task) = 0;

    // Failure text for an exception raised while processing the task.
    virtual std::string faultMessage(const T& task, const std::string& what) const = 0;

    // "transfer" or "share", used in result messages.
    virtual std::string verb() const = 0;

    void runLoop() override {
        log_->info("[{}] Worker loop started", serviceName_);
        while (!interruptFlag_.load()) {
            if (paused_.load()) {
                queue_->waitUntil(std::chrono::milliseconds(cfg_.pause_poll_ms),
                                  [this] { return !paused_.load() || interruptFlag_.load(); });
                continue;
            }
            if (!processNext())
                queue_->waitForPending(std::chrono::milliseconds(cfg_.idle_poll_ms), interruptFlag_);
        }
        log_->info("[{}] Worker loop exited", serviceName_);
    }

    void wakeUp() override { queue_->wake(); }

    [[nodiscard]] std::chrono::milliseconds callDeadline() const {
        return std::chrono::milliseconds(cfg_.remote_call_timeout_ms);
    }

    [[nodiscard]] std::shared_ptr<concurrency::ExecutionLease> acquireLease() const {
        return concurrency::ExecutionLease::acquire(executionLock_);
    }

    // Applies fn to the queued task (or to the claim's copy if the task was
    // removed meanwhile), persists, and returns the resulting state.
    T commit(const Claim& claim, const std::function<void(T&)>& fn) {
        T result = claim.copy;
        const bool queued = queue_->mutate(claim.task, [&](T& t) {
            fn(t);
            result = t;
        });
        if (!queued) {
            fn(result);
            log_->debug("[{}] Task at index {} left the queue while running", serviceName_, claim.index);
        }
        persistSafely(result);
        return result;
    }

    T recordTerminal(const Claim& claim, const types::TaskStatus status, const std::string& message) {
        return commit(claim, [&](T& t) {
            t.status = status;
            t.error_message = message;
        });
    }

    void recordRemoteFailure(const Claim& claim, const int code) {
        const auto message = fmt::format("{} failed (code {}): {}", verb(), code, remote::describe(code));

        if (remote::isSkippable(code)) {
            recordTerminal(claim, types::TaskStatus::Skipped, message);
            log_->warn("[{}] Skipped task at index {}: {}", serviceName_, claim.index, message);
            publish(queue::WorkerEvent::Type::Failed, claim.index, types::TaskStatus::Skipped, "skipped - " + message);
            return;
        }

        recordTerminal(claim, types::TaskStatus::Failed, message);
        log_->error("[{}] Task at index {} failed: {}", serviceName_, claim.index, message);
        publish(queue::WorkerEvent::Type::Failed, claim.index, types::TaskStatus::Failed, message);
        limiter_->onFailure(code);
    }

    void recordTimeout(const Claim& claim, const std::chrono::milliseconds deadline) {
        const auto message = fmt::format("{} timed out after {} ms", verb(), deadline.count());
        recordTerminal(claim, types::TaskStatus::Timeout, message);
        log_->error("[{}] Task at index {}: {}", serviceName_, claim.index, message);
        publish(queue::WorkerEvent::Type::Failed, claim.index, types::TaskStatus::Timeout, message);
        limiter_->onFailure(remote::kCallTimedOut);
    }

    void recordFault(const Claim& claim, const std::string& what) {
        const auto message = faultMessage(claim.copy, what);
        recordTerminal(claim, types::TaskStatus::Failed, message);
        log_->error("[{}] Task at index {} raised: {}", serviceName_, claim.index, what);
        publish(queue::WorkerEvent::Type::Failed, claim.index, types::TaskStatus::Failed, message);
    }

    void publish(const queue::WorkerEvent::Type type, const std::size_t index,
                 const types::TaskStatus status, std::string message) {
        queue::WorkerEvent event;
        event.type = type;
        event.kind = kind_;
        event.index = index;
        event.status = status;
        event.message = std::move(message);
        events_->publish(std::move(event));
    }

    void publishEvent(queue::WorkerEvent event) {
        event.kind = kind_;
        events_->publish(std::move(event));
    }

    // Store faults never reach the task: memory stays authoritative.
    void persistSafely(const T& task) {
        if (!store_ || !task.id) return;
        try {
            persist(*task.id, task);
        } catch (const std::exception& e) {
            log_->error("[{}] Failed to persist task {}: {}", serviceName_, *task.id, e.what());
        }
    }

private:
    std::atomic<bool> paused_{false};
};

} // namespace ferry::workers
