#pragma once

#include "DBConnection.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>

namespace ferry::database {

// Fixed set of connections opened up front. acquire() blocks while all are out.
class DBPool {
  public:
    explicit DBPool(const config::DatabaseConfig& cfg) {
        const size_t size = cfg.pool_size == 0 ? 1 : cfg.pool_size;
        for (size_t i = 0; i < size; ++i) idle_.push(std::make_unique<DBConnection>(cfg));
    }

    // Scoped checkout; the connection goes back to the pool on destruction.
    class Lease {
      public:
        explicit Lease(DBPool& pool) : pool_(pool), conn_(pool.acquire()) {}
        ~Lease() { pool_.release(std::move(conn_)); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        DBConnection* operator->() const { return conn_.get(); }

      private:
        DBPool& pool_;
        std::unique_ptr<DBConnection> conn_;
    };

    std::unique_ptr<DBConnection> acquire() {
        std::unique_lock lock(mtx_);
        cv_.wait(lock, [this] { return !idle_.empty(); });
        auto conn = std::move(idle_.front());
        idle_.pop();
        return conn;
    }

    void release(std::unique_ptr<DBConnection> conn) {
        if (!conn) return;
        {
            std::scoped_lock lock(mtx_);
            idle_.push(std::move(conn));
        }
        cv_.notify_one();
    }

  private:
    std::queue<std::unique_ptr<DBConnection>> idle_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace ferry::database
