#include "database/Transactions.hpp"

namespace ferry::database {

void Transactions::init(const config::DatabaseConfig& cfg) {
    dbPool_ = std::make_shared<DBPool>(cfg);
    logging::LogRegistry::db()->info("[Transactions] Pool ready: {} connection(s) to {}@{}:{}/{}",
                                     cfg.pool_size == 0 ? 1 : cfg.pool_size, cfg.user, cfg.host, cfg.port, cfg.name);
}

void Transactions::shutdown() {
    dbPool_.reset();
}

} // namespace ferry::database
