#pragma once

#include <atomic>
#include <string>
#include <thread>

namespace ferry::services {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    virtual void start();

    // Signals the loop and joins it.
    virtual void stop();

    // Signals the loop without waiting for it to exit.
    void requestStop();

    void join();

    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] bool stopRequested() const { return interruptFlag_.load(); }
    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    // Unblocks whatever runLoop waits on so it can observe interruptFlag_.
    virtual void wakeUp() {}
};

} // namespace ferry::services
