#pragma once

#include "workers/QueueWorker.hpp"
#include "types/ShareTask.hpp"

#include <functional>

namespace ferry::workers {

class ShareWorker final : public QueueWorker<types::ShareTask> {
public:
    using PasswordGenerator = std::function<std::string()>;

    // generator defaults to crypto::generateSharePassword.
    ShareWorker(WorkerDeps<types::ShareTask> deps, const config::QueueConfig& cfg,
                PasswordGenerator generator = {});
    ~ShareWorker() override;

protected:
    void process(const Claim& claim) override;
    void persist(unsigned int id, const types::ShareTask& task) override;
    std::string faultMessage(const types::ShareTask& task, const std::string& what) const override;
    std::string verb() const override { return "share"; }

private:
    PasswordGenerator generator_;

    std::string passwordFor(const types::ShareTask& task) const;
};

} // namespace ferry::workers
