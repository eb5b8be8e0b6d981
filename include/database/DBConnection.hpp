#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <pqxx/connection>

namespace ferry::database {

class DBConnection {
  public:
    explicit DBConnection(const config::DatabaseConfig& cfg);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    void initPrepared() const;

    // libpq key=value connection string for cfg.
    static std::string connectionString(const config::DatabaseConfig& cfg);

  private:
    std::unique_ptr<pqxx::connection> conn_;

    void initPreparedTransferTasks() const;
    void initPreparedShareTasks() const;
};

} // namespace ferry::database
