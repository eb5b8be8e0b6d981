#include "services/AsyncService.hpp"
#include "logging/LogRegistry.hpp"

using namespace ferry::services;
using namespace ferry::logging;

AsyncService::AsyncService(const std::string& serviceName) : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    // Derived loops must already be stopped: runLoop is gone by the time this runs.
    join();
}

void AsyncService::start() {
    if (isRunning()) return;
    join(); // reap a previous loop that exited on its own

    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            LogRegistry::ferry()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    LogRegistry::ferry()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (isRunning()) LogRegistry::ferry()->info("[{}] Stopping service...", serviceName_);
    requestStop();
    join();
    running_.store(false);
}

void AsyncService::requestStop() {
    interruptFlag_.store(true);
    wakeUp();
}

void AsyncService::join() {
    // Only join if we're not calling from the loop's own thread
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
        LogRegistry::ferry()->debug("[{}] Service thread joined.", serviceName_);
    }
}
