#pragma once

#include <nadeef/store/store.hpp>

#include <sqlite3.h>

namespace nadeef::store {

/// Connection over a SQLite database file.
class SqliteConnection final : public Connection {
   public:
    /// Opens (creating if needed) the database at `config.path`.
    [[nodiscard]] static auto open(const StoreConfig& config)
        -> std::expected<std::unique_ptr<SqliteConnection>, std::string>;

    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    auto operator=(const SqliteConnection&) -> SqliteConnection& = delete;

    [[nodiscard]] auto execute(const std::string& sql) -> std::expected<void, std::string> override;
    [[nodiscard]] auto query(const std::string& sql) -> std::expected<ResultSet, std::string> override;

   private:
    explicit SqliteConnection(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
};

class SqliteConnectionFactory final : public ConnectionFactory {
   public:
    [[nodiscard]] auto connect(const StoreConfig& config)
        -> std::expected<std::unique_ptr<Connection>, std::string> override;
};

}  // namespace nadeef::store
