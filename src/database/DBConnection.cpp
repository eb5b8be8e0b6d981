#include "database/DBConnection.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace ferry::logging;

namespace ferry::database {

// Single-quotes a libpq connection parameter value.
static std::string quoteParam(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

std::string DBConnection::connectionString(const config::DatabaseConfig& cfg) {
    std::string s = "host=" + quoteParam(cfg.host) + " port=" + std::to_string(cfg.port) + " dbname=" +
                    quoteParam(cfg.name) + " user=" + quoteParam(cfg.user);
    if (!cfg.password.empty()) s += " password=" + quoteParam(cfg.password);
    return s;
}

DBConnection::DBConnection(const config::DatabaseConfig& cfg)
    : conn_(std::make_unique<pqxx::connection>(connectionString(cfg))) {
    LogRegistry::db()->debug("[DBConnection] Connected to {}@{}:{}/{}", cfg.user, cfg.host, cfg.port, cfg.name);
    initPrepared();
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedTransferTasks();
    initPreparedShareTasks();
}

} // namespace ferry::database
