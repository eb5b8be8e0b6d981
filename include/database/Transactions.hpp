#pragma once

#include "DBPool.hpp"
#include "logging/LogRegistry.hpp"

#include <memory>
#include <pqxx/pqxx>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace ferry::database {

class Transactions {
  public:
    static inline std::shared_ptr<DBPool> dbPool_;

    static void init(const config::DatabaseConfig& cfg);
    static void shutdown();

    [[nodiscard]] static bool isInitialized() { return dbPool_ != nullptr; }

    // Runs func in one transaction on a pooled connection and commits when it
    // returns. Exceptions are logged and rethrown; the uncommitted work rolls back.
    template <typename Func>
    static auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        using Result = decltype(func(std::declval<pqxx::work&>()));

        if (!dbPool_) throw std::runtime_error("[Transactions] exec(" + ctx + ") before init()");

        const auto log = logging::LogRegistry::db();
        DBPool::Lease conn(*dbPool_);
        log->trace("[Transactions] begin {}", ctx);

        try {
            pqxx::work txn(conn->get());
            if constexpr (std::is_void_v<Result>) {
                func(txn);
                txn.commit();
                log->trace("[Transactions] commit {}", ctx);
            } else {
                Result result = func(txn);
                txn.commit();
                log->trace("[Transactions] commit {}", ctx);
                return result;
            }
        } catch (const std::exception& e) {
            log->error("[Transactions] {} rolled back: {}", ctx, e.what());
            throw;
        }
    }
};

} // namespace ferry::database
