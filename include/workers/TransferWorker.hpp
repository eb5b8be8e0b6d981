#pragma once

#include "workers/QueueWorker.hpp"
#include "types/TransferTask.hpp"

namespace ferry::workers {

class TransferWorker final : public QueueWorker<types::TransferTask> {
public:
    TransferWorker(WorkerDeps<types::TransferTask> deps, const config::QueueConfig& cfg);
    ~TransferWorker() override;

protected:
    void process(const Claim& claim) override;
    void persist(unsigned int id, const types::TransferTask& task) override;
    std::string faultMessage(const types::TransferTask& task, const std::string& what) const override;
    std::string verb() const override { return "transfer"; }
};

} // namespace ferry::workers
